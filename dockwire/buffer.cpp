//
// Created by dc on 09/11/18.
//

#include <algorithm>

#include "buffer.h"

namespace dockwire {

    OBuffer::OBuffer(size_t is)
    {
        if (is)
            grow((uint32_t) is);
    }

    OBuffer::OBuffer(OBuffer && other) noexcept
            : m_data(other.m_data),
              m_size(other.m_size),
              m_offset(other.m_offset)
    {
        other.m_data = nullptr;
        other.m_size = other.m_offset = 0;
    }

    OBuffer& OBuffer::operator=(OBuffer &&other) noexcept {
        if (this != &other) {
            ::free(m_data);
            m_data   = other.m_data;
            m_size   = other.m_size;
            m_offset = other.m_offset;
            other.m_data = nullptr;
            other.m_size = other.m_offset = 0;
        }
        return *this;
    }

    OBuffer::~OBuffer() {
        ::free(m_data);
        m_data = nullptr;
    }

    ssize_t OBuffer::append(const void *data, size_t len) {
        if (len && data == nullptr)
            throw Exception::invalidArguments("OBuffer::append - data cannot be null");

        if (capacity() < len)
            grow((uint32_t) std::max<size_t>(m_size, len));

        memcpy(m_data + m_offset, data, len);
        m_offset += (uint32_t) len;
        return len;
    }

    void OBuffer::grow(uint32_t add) {
        // keep allocations pointer aligned, plus one byte for a terminator
        uint32_t mask = sizeof(void*) - 1;
        add = (add + mask) & ~mask;
        auto *tmp = (uint8_t *) ::realloc(m_data, m_size + add + 1);
        if (tmp == nullptr)
            throw Exception::create("OBuffer::grow(", add, ") failed: ", errno_s);
        m_data = tmp;
        m_size += add;
    }

    void OBuffer::reserve(size_t size) {
        if (capacity() < size)
            grow((uint32_t) (size - capacity()));
    }

    void OBuffer::seek(off_t off) {
        off_t pos = (off_t) m_offset + off;
        if (pos < 0 || pos > (off_t) m_size)
            throw Exception::outOfRange("OBuffer::seek - offset ", off, " out of range");
        m_offset = (uint32_t) pos;
    }

    void OBuffer::consume(size_t n) {
        if (n >= m_offset) {
            m_offset = 0;
            return;
        }
        memmove(m_data, m_data + n, m_offset - n);
        m_offset -= (uint32_t) n;
    }

    void OBuffer::reset(size_t size, bool keep) {
        m_offset = 0;
        if (keep && size <= m_size)
            return;

        auto *tmp = (uint8_t *) ::realloc(m_data, size + 1);
        if (tmp == nullptr)
            throw Exception::create("OBuffer::reset(", size, ") failed: ", errno_s);
        m_data = tmp;
        m_size = (uint32_t) size;
    }
}
