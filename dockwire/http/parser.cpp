//
// Created by dc on 28/06/17.
//

#include "parser.h"

namespace dockwire::http {

    Parser::Parser(http_parser_type type)
    {
        http_parser_init(this, type);
    }

    int Parser::onMessageBegin(http_parser *s) {
        auto *p = static_cast<Parser*>(s);
        p->clear();
        return 0;
    }

    int Parser::onHeaderField(http_parser *s, const char *at, size_t len) {
        auto *p = static_cast<Parser*>(s);
        switch (p->state)
        {
            case STATE_FIELD:
                p->hf.append(at, len);
                break;
            case STATE_VALUE:
                // a new field starts, the previous pair is complete
                p->pushHeader();
                p->hf.append(at, len);
                p->state = STATE_FIELD;
                break;
            default:
                break;
        }
        return 0;
    }

    int Parser::onHeaderValue(http_parser *s, const char *at, size_t len) {
        auto *p = static_cast<Parser*>(s);
        p->hv.append(at, len);
        p->state = STATE_VALUE;
        return 0;
    }

    int Parser::onHeadersComplete(http_parser *s) {
        auto *p = static_cast<Parser*>(s);
        if (!p->hf.empty()) {
            p->pushHeader();
        }
        p->headersComplete = true;
        return 0;
    }

    int Parser::onBody(http_parser *s, const char *at, size_t len) {
        auto *p = static_cast<Parser*>(s);
        return p->handleBodyPart(at, len);
    }

    int Parser::onMsgComplete(http_parser *s) {
        auto *p = static_cast<Parser*>(s);
        p->bodyComplete = true;
        // stop parsing, bytes of a next message never belong to us
        http_parser_pause(s, 1);
        return 0;
    }

    void Parser::pushHeader() {
        headers[hf] = hv;
        hf.clear();
        hv.clear();
    }

    bool Parser::feed(const char *buf, size_t len) {
        const static http_parser_settings PARSER_SETTINGS {
                Parser::onMessageBegin,
                nullptr,
                nullptr,
                Parser::onHeaderField,
                Parser::onHeaderValue,
                Parser::onHeadersComplete,
                Parser::onBody,
                Parser::onMsgComplete,
                nullptr,
                nullptr
        };

        if (bodyComplete) {
            // message already parsed
            return len == 0;
        }

        size_t nparsed = http_parser_execute(this, &PARSER_SETTINGS, buf, len);
        if (bodyComplete) {
            return true;
        }
        return nparsed == len && HTTP_PARSER_ERRNO(this) == HPE_OK;
    }

    void Parser::clear() {
        state = STATE_FIELD;
        headersComplete = false;
        bodyComplete = false;
        hf.clear();
        hv.clear();
        headers.clear();
    }
}
