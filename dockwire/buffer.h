//
// Created by dc on 09/11/18.
//

#ifndef DOCKWIRE_BUFFER_H
#define DOCKWIRE_BUFFER_H

#include <type_traits>

#include <dockwire/base.h>

namespace dockwire {

    /**
     * A lightweight output buffer, used for encoding requests
     * and for staging response bytes before they are decoded
     */
    struct OBuffer {

        /**
         * @param is the number of bytes to allocate upfront
         */
        OBuffer(size_t is);

        OBuffer()
            : OBuffer(0)
        {}

        OBuffer(const OBuffer&) = delete;
        OBuffer&operator=(const OBuffer&) = delete;

        OBuffer(OBuffer&&) noexcept;

        OBuffer&operator=(OBuffer&& other) noexcept;

        ~OBuffer();

        /**
         * append data into the buffer
         * @param data the data to append into the buffer
         * @param size the size of the data being appended
         * @return the number of bytes written into the buffer
         */
        ssize_t append(const void *data, size_t size);

        inline ssize_t append(const char* str) {
            return append(str, strlen(str));
        }

        inline ssize_t append(const strview& sv) {
            return append(sv.data(), sv.size());
        }

        inline ssize_t append(const std::string& str) {
            return append(str.data(), str.size());
        }

        /**
         * empties the buffer and makes room for \param size bytes
         * @param keep reuse the current allocation when it is big enough
         */
        void reset(size_t size, bool keep = false);

        /**
         * move offset forward by \param off bytes, used after writing
         * directly into the memory returned by \see end()
         * @param off the number of bytes to offset
         */
        void seek(off_t off);

        /**
         * drops the first \param n bytes of the buffer, shifting the
         * remaining bytes to the front
         * @param n the number of bytes to drop
         */
        void consume(size_t n);

        /**
         * makes room for at least \param size more bytes
         */
        void reserve(size_t size);

        operator std::string() const {
            return std::string((const char*) m_data, m_offset);
        }

        operator strview() const {
            return strview((const char*) m_data, size());
        }

        inline size_t size() const {
            return m_offset;
        }

        inline bool empty() const {
            return m_offset == 0;
        }

        char* data() const {
            return (char *) m_data;
        }

        /**
         * @return pointer to the first unused byte of the buffer
         */
        char* end() const {
            return (char *)(m_data + m_offset);
        }

        /**
         * @return the number of bytes that can be appended without growing
         */
        size_t capacity() const {
            return m_size-m_offset;
        }

        inline OBuffer& operator<<(const char *str) {
            append(str);
            return Ego;
        }

        inline OBuffer& operator<<(const std::string &str) {
            append(str);
            return Ego;
        }

        inline OBuffer& operator<<(const strview sv) {
            append(sv);
            return Ego;
        }

    private:
        void grow(uint32_t add);

        uint8_t  *m_data{nullptr};
        uint32_t  m_size{0};
        uint32_t  m_offset{0};
    };
}

#endif //DOCKWIRE_BUFFER_H
