//
// Created by dc on 09/11/18.
//

#ifndef DOCKWIRE_SYMBOLS_H
#define DOCKWIRE_SYMBOLS_H

#include <iod/symbol.hh>

#ifndef IOD_SYMBOL_verbose
#define IOD_SYMBOL_verbose
    iod_define_symbol(verbose)
#endif

#ifndef IOD_SYMBOL_logsink
#define IOD_SYMBOL_logsink
    iod_define_symbol(logsink)
#endif

#ifndef IOD_SYMBOL_logformat
#define IOD_SYMBOL_logformat
    iod_define_symbol(logformat)
#endif

#ifndef IOD_SYMBOL_name
#define IOD_SYMBOL_name
    iod_define_symbol(name)
#endif

#ifndef IOD_SYMBOL_connectTimeout
#define IOD_SYMBOL_connectTimeout
    iod_define_symbol(connectTimeout)
#endif

#ifndef IOD_SYMBOL_readTimeout
#define IOD_SYMBOL_readTimeout
    iod_define_symbol(readTimeout)
#endif

#ifndef IOD_SYMBOL_poolSize
#define IOD_SYMBOL_poolSize
    iod_define_symbol(poolSize)
#endif

#ifndef IOD_SYMBOL_certPath
#define IOD_SYMBOL_certPath
    iod_define_symbol(certPath)
#endif

#ifndef IOD_SYMBOL_auth
#define IOD_SYMBOL_auth
    iod_define_symbol(auth)
#endif

#ifndef IOD_SYMBOL_apiVersion
#define IOD_SYMBOL_apiVersion
    iod_define_symbol(apiVersion)
#endif

#ifndef IOD_SYMBOL_status
#define IOD_SYMBOL_status
    iod_define_symbol(status)
#endif

#ifndef IOD_SYMBOL_id
#define IOD_SYMBOL_id
    iod_define_symbol(id)
#endif

#ifndef IOD_SYMBOL_progress
#define IOD_SYMBOL_progress
    iod_define_symbol(progress)
#endif

#ifndef IOD_SYMBOL_progressDetail
#define IOD_SYMBOL_progressDetail
    iod_define_symbol(progressDetail)
#endif

#ifndef IOD_SYMBOL_current
#define IOD_SYMBOL_current
    iod_define_symbol(current)
#endif

#ifndef IOD_SYMBOL_total
#define IOD_SYMBOL_total
    iod_define_symbol(total)
#endif

#ifndef IOD_SYMBOL_error
#define IOD_SYMBOL_error
    iod_define_symbol(error)
#endif

#ifndef IOD_SYMBOL_errorDetail
#define IOD_SYMBOL_errorDetail
    iod_define_symbol(errorDetail)
#endif

#ifndef IOD_SYMBOL_code
#define IOD_SYMBOL_code
    iod_define_symbol(code)
#endif

#ifndef IOD_SYMBOL_message
#define IOD_SYMBOL_message
    iod_define_symbol(message)
#endif

#ifndef IOD_SYMBOL_stream
#define IOD_SYMBOL_stream
    iod_define_symbol(stream)
#endif

#ifndef IOD_SYMBOL_aux
#define IOD_SYMBOL_aux
    iod_define_symbol(aux)
#endif

#ifndef IOD_SYMBOL_ID
#define IOD_SYMBOL_ID
    iod_define_symbol(ID)
#endif

#ifndef IOD_SYMBOL_Version
#define IOD_SYMBOL_Version
    iod_define_symbol(Version)
#endif

#ifndef IOD_SYMBOL_ApiVersion
#define IOD_SYMBOL_ApiVersion
    iod_define_symbol(ApiVersion)
#endif

#ifndef IOD_SYMBOL_Os
#define IOD_SYMBOL_Os
    iod_define_symbol(Os)
#endif

#ifndef IOD_SYMBOL_Arch
#define IOD_SYMBOL_Arch
    iod_define_symbol(Arch)
#endif

#ifndef IOD_SYMBOL_KernelVersion
#define IOD_SYMBOL_KernelVersion
    iod_define_symbol(KernelVersion)
#endif

#ifndef IOD_SYMBOL_GoVersion
#define IOD_SYMBOL_GoVersion
    iod_define_symbol(GoVersion)
#endif

#ifndef IOD_SYMBOL_GitCommit
#define IOD_SYMBOL_GitCommit
    iod_define_symbol(GitCommit)
#endif

#ifndef IOD_SYMBOL_StatusCode
#define IOD_SYMBOL_StatusCode
    iod_define_symbol(StatusCode)
#endif

#ifndef IOD_SYMBOL_Error
#define IOD_SYMBOL_Error
    iod_define_symbol(Error)
#endif

#ifndef IOD_SYMBOL_Id
#define IOD_SYMBOL_Id
    iod_define_symbol(Id)
#endif

#ifndef IOD_SYMBOL_username
#define IOD_SYMBOL_username
    iod_define_symbol(username)
#endif

#ifndef IOD_SYMBOL_password
#define IOD_SYMBOL_password
    iod_define_symbol(password)
#endif

#ifndef IOD_SYMBOL_email
#define IOD_SYMBOL_email
    iod_define_symbol(email)
#endif

#ifndef IOD_SYMBOL_serveraddress
#define IOD_SYMBOL_serveraddress
    iod_define_symbol(serveraddress)
#endif

#ifndef IOD_SYMBOL_identitytoken
#define IOD_SYMBOL_identitytoken
    iod_define_symbol(identitytoken)
#endif

#ifndef IOD_SYMBOL_follow
#define IOD_SYMBOL_follow
    iod_define_symbol(follow)
#endif

#ifndef IOD_SYMBOL_stdOut
#define IOD_SYMBOL_stdOut
    iod_define_symbol(stdOut)
#endif

#ifndef IOD_SYMBOL_stdErr
#define IOD_SYMBOL_stdErr
    iod_define_symbol(stdErr)
#endif

#ifndef IOD_SYMBOL_timestamps
#define IOD_SYMBOL_timestamps
    iod_define_symbol(timestamps)
#endif

#ifndef IOD_SYMBOL_tail
#define IOD_SYMBOL_tail
    iod_define_symbol(tail)
#endif

#ifndef IOD_SYMBOL_since
#define IOD_SYMBOL_since
    iod_define_symbol(since)
#endif

#ifndef IOD_SYMBOL_logs
#define IOD_SYMBOL_logs
    iod_define_symbol(logs)
#endif

#ifndef IOD_SYMBOL_stdIn
#define IOD_SYMBOL_stdIn
    iod_define_symbol(stdIn)
#endif

#ifndef IOD_SYMBOL_optional
#define IOD_SYMBOL_optional
    iod_define_symbol(optional)
#endif

#ifndef IOD_SYMBOL_Tag
#define IOD_SYMBOL_Tag
    iod_define_symbol(Tag)
#endif

#ifndef IOD_SYMBOL_Digest
#define IOD_SYMBOL_Digest
    iod_define_symbol(Digest)
#endif

#ifndef IOD_SYMBOL_Size
#define IOD_SYMBOL_Size
    iod_define_symbol(Size)
#endif

#endif //DOCKWIRE_SYMBOLS_H
