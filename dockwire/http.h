//
// Created by dc on 28/06/17.
//

#ifndef DOCKWIRE_HTTP_H
#define DOCKWIRE_HTTP_H

#include <dockwire/base.h>

namespace dockwire::http {

    enum class Method : unsigned char {
        Delete = 0,
        Get,
        Head,
        Post,
        Put,
        Unknown
    };

    /**
     * The statuses the docker engine API documents for its endpoints
     */
    enum class Status : int {
        OK				            = 200,
        CREATED			            = 201,
        NO_CONTENT			        = 204,
        NOT_MODIFIED		        = 304,
        BAD_REQUEST			        = 400,
        UNAUTHORIZED		        = 401,
        FORBIDDEN			        = 403,
        NOT_FOUND			        = 404,
        NOT_ACCEPTABLE		        = 406,
        CONFLICT			        = 409,
        INTERNAL_ERROR		        = 500,
        SERVICE_UNAVAILABLE	    	= 503
    };

    /**
     * @return the status line text, e.g "404 Not Found", or an empty
     * string if \param status is not one of \see Status
     */
    static inline const char *
    status_text(Status status)
    {
        switch (status) {
            case Status::OK:                  return "200 OK";
            case Status::CREATED:             return "201 Created";
            case Status::NO_CONTENT:          return "204 No Content";
            case Status::NOT_MODIFIED:        return "304 Not Modified";
            case Status::BAD_REQUEST:         return "400 Bad Request";
            case Status::UNAUTHORIZED:        return "401 Unauthorized";
            case Status::FORBIDDEN:           return "403 Forbidden";
            case Status::NOT_FOUND:           return "404 Not Found";
            case Status::NOT_ACCEPTABLE:      return "406 Not Acceptable";
            case Status::CONFLICT:            return "409 Conflict";
            case Status::INTERNAL_ERROR:      return "500 Internal Server Error";
            case Status::SERVICE_UNAVAILABLE: return "503 Service Unavailable";
            default:                          return "";
        }
    }

    static inline const char* method_name(Method method)
    {
        switch(method)
        {
            case Method::Delete: return "DELETE";
            case Method::Get:    return "GET";
            case Method::Head:   return "HEAD";
            case Method::Post:   return "POST";
            case Method::Put:    return "PUT";
            default:             return "Invalid";
        }
    }
}

#endif //DOCKWIRE_HTTP_H
