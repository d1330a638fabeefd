//
// Created by dc on 13/11/18.
//

#include "errors.h"
#include "utils.h"

namespace dockwire {

    static std::string describe(const std::exception_ptr& ep) {
        if (ep == nullptr) {
            return "unknown error";
        }

        try {
            std::rethrow_exception(ep);
        }
        catch (const std::exception& ex) {
            return ex.what();
        }
        catch (...) {
            return "unknown error";
        }
    }

    DockerError DockerError::wrap(std::exception_ptr cause) {
        auto msg = describe(cause);
        return DockerError(std::move(msg), std::move(cause));
    }

    RequestError::RequestError(http::Method method, std::string uri, int status,
                               std::string message, std::exception_ptr cause)
        : DockerError(utils::catstr("Request error: ", http::method_name(method), " ",
                                    uri, ": ", status),
                      std::move(cause), errors::RequestError),
          m_method(method),
          m_uri(std::move(uri)),
          m_status(status),
          m_message(std::move(message))
    {
        if (!m_message.empty()) {
            Msg += ", body: " + m_message;
        }
    }

    TimeoutError::TimeoutError(http::Method method, std::string uri, std::exception_ptr cause)
        : DockerError(utils::catstr("Timeout: ", http::method_name(method), " ", uri),
                      std::move(cause), errors::TimeoutError),
          m_method(method),
          m_uri(std::move(uri))
    {}

    ContainerNotFoundError::ContainerNotFoundError(std::string id, std::exception_ptr cause)
        : DockerError(utils::catstr("Container not found: ", id), std::move(cause), errors::NotFound),
          m_id(std::move(id))
    {}

    ImageNotFoundError::ImageNotFoundError(std::string image, std::exception_ptr cause)
        : DockerError(utils::catstr("Image not found: ", image), std::move(cause), errors::NotFound),
          m_image(std::move(image))
    {}

    InterruptedError::InterruptedError(http::Method method, const std::string &uri)
        : Exception(utils::catstr("Interrupted: ", http::method_name(method), " ", uri),
                    errors::Interrupted)
    {}

    std::exception_ptr classify(std::exception_ptr failure, http::Method method, const std::string &uri) {
        if (failure == nullptr) {
            return std::make_exception_ptr(DockerError("unknown error"));
        }

        std::exception_ptr cause = failure;
        while (cause != nullptr) {
            std::exception_ptr next{nullptr};
            try {
                std::rethrow_exception(cause);
            }
            catch (const DockerError&) {
                // already classified
                return cause;
            }
            catch (const InterruptedError&) {
                return cause;
            }
            catch (const ResponseError& ex) {
                return std::make_exception_ptr(
                        RequestError(method, uri, ex.status(), ex.body(), failure));
            }
            catch (const ReadTimeout&) {
                return std::make_exception_ptr(TimeoutError(method, uri, failure));
            }
            catch (const ConnectTimeout&) {
                return std::make_exception_ptr(TimeoutError(method, uri, failure));
            }
            catch (const InterruptedIO&) {
                return std::make_exception_ptr(InterruptedError(method, uri));
            }
            catch (const std::exception& ex) {
                if (auto nested = dynamic_cast<const std::nested_exception*>(&ex)) {
                    next = nested->nested_ptr();
                }
            }
            catch (...) {
                // not a standard exception, nothing nested to look into
                next = nullptr;
            }
            cause = next;
        }

        return std::make_exception_ptr(DockerError::wrap(failure));
    }

    void propagate(std::exception_ptr failure, http::Method method, const std::string &uri) {
        std::rethrow_exception(classify(std::move(failure), method, uri));
    }
}
