#ifndef __ETL_PROFILE_H__
#define __ETL_PROFILE_H__

// boilerlink - ETL host profile
// Linux host build: the STL is available, so ETL runs alongside it. ETL
// errors are logged through the error handler instead of throwing.

#define ETL_LOG_ERRORS
#define ETL_VERBOSE_ERRORS
#define ETL_CHECK_PUSH_POP

#endif
