#pragma once
#ifndef _KV_TABLES_UTILS_HPP_INCLUDED
#define _KV_TABLES_UTILS_HPP_INCLUDED

/// \file utils.hpp
/// \brief Error helpers, type traits and the value codec used for stored values.

/// \ingroup kvt_utils
/// @{

namespace kvt {

    /// \brief Byte sequence exchanged with storage providers.
    using Bytes = std::vector<uint8_t>;

    /// \brief Throws a TableException if MDBX return code indicates an error.
    /// \param rc      Return code from an MDBX function.
    /// \param context Description of the calling context.
    inline void check_mdbx(int rc, const std::string& context) {
        if (rc != MDBX_SUCCESS) {
            KVT_LOG_ERROR("{}: ({}) {}", context, rc, mdbx_strerror(rc));
            throw TableException(
                TableErrc::STORAGE_ERROR,
                context + ": (" + std::to_string(rc) + ") " + std::string(mdbx_strerror(rc)),
                rc);
        }
    }

    /// \brief Zero-copy MDBX view over \a bytes.
    /// \warning \a bytes must outlive the MDBX call the view is passed to.
    inline MDBX_val to_mdbx_val(const Bytes& bytes) noexcept {
        MDBX_val v;
        v.iov_base = bytes.empty() ? nullptr : const_cast<void*>(static_cast<const void*>(bytes.data()));
        v.iov_len  = bytes.size();
        return v;
    }

    /// \brief Copies MDBX-owned memory into a byte vector.
    inline Bytes to_bytes(const MDBX_val& val) {
        const uint8_t* ptr = static_cast<const uint8_t*>(val.iov_base);
        return val.iov_len ? Bytes(ptr, ptr + val.iov_len) : Bytes();
    }

    /// \brief Compares an MDBX key with key bytes in provider order.
    /// \return Negative, zero or positive like memcmp.
    inline int compare_key(const MDBX_val& lhs, const Bytes& rhs) noexcept {
        const size_t n = std::min(lhs.iov_len, rhs.size());
        int rc = n ? std::memcmp(lhs.iov_base, rhs.data(), n) : 0;
        if (rc != 0) return rc;
        if (lhs.iov_len == rhs.size()) return 0;
        return lhs.iov_len < rhs.size() ? -1 : 1;
    }

    /// \brief Throws a STORAGE_ERROR describing malformed stored bytes.
    [[noreturn]] inline void throw_corrupted(const std::string& context) {
        throw TableException(TableErrc::STORAGE_ERROR, context);
    }

    // --- Traits ---

    /// \brief Trait to check if a type provides a `to_bytes()` member.
    /// \tparam T Type under inspection.
    template <typename T>
    struct has_to_bytes {
    private:
        template <typename U>
        static auto check(U*) -> decltype(std::declval<const U>().to_bytes(), std::true_type());
        template <typename>
        static std::false_type check(...);
    public:
        static const bool value = decltype(check<T>(0))::value;
    };

    /// \brief Trait to check if a type provides a static `from_bytes()` method.
    /// \tparam T Type under inspection.
    template <typename T>
    struct has_from_bytes {
    private:
        template <typename U>
        static auto check(U*) -> decltype(U::from_bytes((const void*)0, size_t(0)), std::true_type());
        template <typename>
        static std::false_type check(...);
    public:
        static const bool value = decltype(check<T>(0))::value;
    };

    /// \brief Trait indicating that a container defines `value_type`.
    /// \tparam T Container type.
    template <typename T>
    struct has_value_type {
    private:
        template <typename U>
        static auto check(U*) -> decltype(std::declval<typename U::value_type>(), std::true_type());
        template <typename>
        static std::false_type check(...);
    public:
        static const bool value = decltype(check<T>(0))::value;
    };

    /// \brief True for vectors of one-byte elements.
    template <typename T>
    struct is_byte_vector : std::integral_constant<bool,
#       if __cplusplus >= 201703L
        std::is_same<T, std::vector<std::byte>>::value ||
#       endif
        std::is_same<T, std::vector<uint8_t>>::value ||
        std::is_same<T, std::vector<char>>::value ||
        std::is_same<T, std::vector<unsigned char>>::value> {};

    /// \brief True for sequence containers of strings.
    template <typename T, typename = void>
    struct is_string_sequence : std::false_type {};

    template <typename T>
    struct is_string_sequence<T, typename std::enable_if<
        has_value_type<T>::value &&
        std::is_same<typename T::value_type, std::string>::value>::type>
        : std::integral_constant<bool,
            std::is_same<T, std::vector<std::string>>::value ||
            std::is_same<T, std::deque<std::string>>::value ||
            std::is_same<T, std::list<std::string>>::value> {};

    /// \brief True for vector, deque and list of trivially copyable elements (byte vectors excluded).
    template <typename T, typename = void>
    struct is_pod_sequence : std::false_type {};

    template <typename T>
    struct is_pod_sequence<T, typename std::enable_if<has_value_type<T>::value>::type>
        : std::integral_constant<bool,
            !is_byte_vector<T>::value &&
            std::is_trivially_copyable<typename T::value_type>::value &&
            (std::is_same<T, std::vector<typename T::value_type>>::value ||
             std::is_same<T, std::deque<typename T::value_type>>::value ||
             std::is_same<T, std::list<typename T::value_type>>::value)> {};

    /// \brief True when the value codec has no dedicated overload for the type.
    template <typename T>
    struct is_plain_value : std::integral_constant<bool,
        !has_to_bytes<T>::value &&
        !std::is_same<T, std::string>::value &&
        !is_byte_vector<T>::value &&
        !is_string_sequence<T>::value &&
        !is_pod_sequence<T>::value &&
        std::is_trivially_copyable<T>::value> {};

    /// \brief Appends \a n raw bytes to \a out.
    inline void append_bytes(Bytes& out, const void* p, size_t n) {
        const uint8_t* b = static_cast<const uint8_t*>(p);
        out.insert(out.end(), b, b + n);
    }

    // --- serialize_value overloads ---

    /// \brief Serializes a std::string value.
    template<typename T>
    typename std::enable_if<std::is_same<T, std::string>::value>::type
    serialize_value(const T& value, Bytes& out) {
        append_bytes(out, value.data(), value.size());
    }

    /// \brief Serializes a byte vector.
    template<typename T>
    typename std::enable_if<is_byte_vector<T>::value>::type
    serialize_value(const T& value, Bytes& out) {
        append_bytes(out, value.data(), value.size());
    }

    /// \brief Serializes vector, deque or list of trivially copyable elements.
    template<typename T>
    typename std::enable_if<is_pod_sequence<T>::value>::type
    serialize_value(const T& container, Bytes& out) {
        using Elem = typename T::value_type;
        out.reserve(out.size() + container.size() * sizeof(Elem));
        for (const auto& item : container) {
            append_bytes(out, &item, sizeof(Elem));
        }
    }

    /// \brief Serializes a container of strings as length-prefixed records.
    template<typename T>
    typename std::enable_if<is_string_sequence<T>::value>::type
    serialize_value(const T& container, Bytes& out) {
        for (const auto& str : container) {
            uint32_t len = static_cast<uint32_t>(str.size());
            append_bytes(out, &len, sizeof(uint32_t));
            append_bytes(out, str.data(), str.size());
        }
    }

    /// \brief Serializes a value using its `to_bytes()` method.
    template<typename T>
    typename std::enable_if<has_to_bytes<T>::value>::type
    serialize_value(const T& value, Bytes& out) {
        const auto bytes = value.to_bytes();
        append_bytes(out, bytes.data(), bytes.size());
    }

    /// \brief Serializes any other trivially copyable value.
    template<typename T>
    typename std::enable_if<is_plain_value<T>::value>::type
    serialize_value(const T& value, Bytes& out) {
        append_bytes(out, &value, sizeof(T));
    }

    // --- deserialize_value overloads ---

    /// \brief Deserializes a std::string value.
    template<typename T>
    typename std::enable_if<std::is_same<T, std::string>::value, T>::type
    deserialize_value(const uint8_t* data, size_t size) {
        return std::string(reinterpret_cast<const char*>(data), size);
    }

    /// \brief Deserializes a byte vector.
    template<typename T>
    typename std::enable_if<is_byte_vector<T>::value, T>::type
    deserialize_value(const uint8_t* data, size_t size) {
        T out(size);
        if (size) std::memcpy(out.data(), data, size);
        return out;
    }

    /// \brief Deserializes vector, deque or list of trivially copyable elements.
    template<typename T>
    typename std::enable_if<is_pod_sequence<T>::value, T>::type
    deserialize_value(const uint8_t* data, size_t size) {
        using Elem = typename T::value_type;
        if (size % sizeof(Elem) != 0) {
            throw_corrupted("deserialize_value: size not aligned");
        }
        T result;
        for (size_t off = 0; off < size; off += sizeof(Elem)) {
            Elem item;
            std::memcpy(&item, data + off, sizeof(Elem));
            result.push_back(item);
        }
        return result;
    }

    /// \brief Deserializes a container of strings.
    template<typename T>
    typename std::enable_if<is_string_sequence<T>::value, T>::type
    deserialize_value(const uint8_t* data, size_t size) {
        const uint8_t* ptr = data;
        const uint8_t* end = data + size;

        T result;
        while (ptr + sizeof(uint32_t) <= end) {
            uint32_t len;
            std::memcpy(&len, ptr, sizeof(uint32_t));
            ptr += sizeof(uint32_t);

            if (len > static_cast<size_t>(end - ptr))
                throw_corrupted("deserialize_value: corrupted data (length overflow)");

            result.emplace_back(reinterpret_cast<const char*>(ptr), len);
            ptr += len;
        }

        if (ptr != end)
            throw_corrupted("deserialize_value: trailing data after deserialization");

        return result;
    }

    /// \brief Deserializes a value using its `from_bytes()` method.
    template<typename T>
    typename std::enable_if<has_from_bytes<T>::value, T>::type
    deserialize_value(const uint8_t* data, size_t size) {
        return T::from_bytes(static_cast<const void*>(data), size);
    }

    /// \brief Deserializes a trivially copyable value.
    template<typename T>
    typename std::enable_if<!has_from_bytes<T>::value && is_plain_value<T>::value, T>::type
    deserialize_value(const uint8_t* data, size_t size) {
        if (size != sizeof(T)) {
            throw_corrupted("deserialize_value: size mismatch");
        }
        T out;
        std::memcpy(&out, data, sizeof(T));
        return out;
    }

} // namespace kvt

/// @}

#endif // _KV_TABLES_UTILS_HPP_INCLUDED
