#pragma once
#ifndef _KV_TABLES_KEY_CODEC_HPP_INCLUDED
#define _KV_TABLES_KEY_CODEC_HPP_INCLUDED

/// \file KeyCodec.hpp
/// \brief Order-preserving key serialization.
///
/// Storage providers compare keys as unsigned bytes (memcmp order, shorter
/// prefix first). Every encoding below is chosen so that this byte order
/// matches the natural order of the key type:
///
/// | key type                     | encoding                                  |
/// |------------------------------|-------------------------------------------|
/// | bool                         | one byte, 0 or 1                          |
/// | unsigned integers            | fixed-width big-endian                    |
/// | signed integers              | big-endian with the sign bit flipped      |
/// | enums                        | encoding of the underlying type           |
/// | float, double                | sortable bit pattern, big-endian          |
/// | std::string, byte vectors    | raw bytes                                 |
/// | std::array<uint8_t, N>       | raw bytes                                 |
/// | std::pair, std::tuple        | components in order                       |
/// | to_bytes()/from_bytes() types| raw bytes; order is the type's own contract |
///
/// Floating point zero is encoded as +0.0, so -0.0 and +0.0 address the
/// same entry and decode as +0.0. NaN payloads stay distinct keys.
///
/// Variable-length values that are not the last component of a composite
/// key are escaped (0x00 becomes 0x00 0xFF) and terminated by 0x00 0x00, so
/// component boundaries never change the ordering.

/// \ingroup kvt_utils
/// @{

namespace kvt {

    /// \brief Convert IEEE754 float to monotonic sortable unsigned int key.
    /// \param f Input float value.
    /// \return Unsigned 32-bit integer with preserved numeric order.
    inline uint32_t sortable_key_from_float(float f) {
        uint32_t u;
        std::memcpy(&u, &f, sizeof(uint32_t));
        return (u & 0x80000000u) ? ~u : (u ^ 0x80000000u);
    }

    /// \brief Inverse of \ref sortable_key_from_float.
    inline float float_from_sortable_key(uint32_t k) {
        uint32_t u = (k & 0x80000000u) ? (k ^ 0x80000000u) : ~k;
        float f;
        std::memcpy(&f, &u, sizeof(float));
        return f;
    }

    /// \brief Convert IEEE754 double to monotonic sortable unsigned int key.
    /// \param d Input double value.
    /// \return Unsigned 64-bit integer with preserved numeric order.
    inline uint64_t sortable_key_from_double(double d) {
        uint64_t u;
        std::memcpy(&u, &d, sizeof(uint64_t));
        return (u & 0x8000000000000000ull) ? ~u : (u ^ 0x8000000000000000ull);
    }

    /// \brief Inverse of \ref sortable_key_from_double.
    inline double double_from_sortable_key(uint64_t k) {
        uint64_t u = (k & 0x8000000000000000ull) ? (k ^ 0x8000000000000000ull) : ~k;
        double d;
        std::memcpy(&d, &u, sizeof(double));
        return d;
    }

    namespace detail {

        template <typename U>
        inline void put_be(Bytes& out, U v) {
            static_assert(std::is_unsigned<U>::value, "put_be expects an unsigned type");
            for (int shift = static_cast<int>(sizeof(U) * 8) - 8; shift >= 0; shift -= 8) {
                out.push_back(static_cast<uint8_t>(v >> shift));
            }
        }

        template <typename U>
        inline U get_be(const uint8_t*& p, const uint8_t* end) {
            static_assert(std::is_unsigned<U>::value, "get_be expects an unsigned type");
            if (static_cast<size_t>(end - p) < sizeof(U)) {
                throw_corrupted("deserialize_key: truncated fixed-width key");
            }
            U v = 0;
            for (size_t i = 0; i < sizeof(U); ++i) {
                v = static_cast<U>((v << 8) | static_cast<U>(*p++));
            }
            return v;
        }

        /// \brief Writes a variable-length component; escapes it unless it is the last one.
        inline void put_var(Bytes& out, const void* data, size_t n, bool last) {
            const uint8_t* b = static_cast<const uint8_t*>(data);
            if (last) {
                out.insert(out.end(), b, b + n);
                return;
            }
            for (size_t i = 0; i < n; ++i) {
                out.push_back(b[i]);
                if (b[i] == 0x00) out.push_back(0xFF);
            }
            out.push_back(0x00);
            out.push_back(0x00);
        }

        /// \brief Reads a component written by \ref put_var.
        inline Bytes get_var(const uint8_t*& p, const uint8_t* end, bool last) {
            if (last) {
                Bytes res(p, end);
                p = end;
                return res;
            }
            Bytes res;
            while (p < end) {
                uint8_t b = *p++;
                if (b != 0x00) {
                    res.push_back(b);
                    continue;
                }
                if (p == end) break;
                uint8_t next = *p++;
                if (next == 0x00) return res;
                if (next != 0xFF) {
                    throw_corrupted("deserialize_key: bad escape sequence");
                }
                res.push_back(0x00);
            }
            throw_corrupted("deserialize_key: unterminated key component");
        }

    } // namespace detail

    /// \struct KeyCodec
    /// \brief Encodes and decodes keys of type \c T.
    ///
    /// Each specialization provides:
    /// - `encode(const T&, Bytes& out, bool last)` appending the encoding;
    /// - `decode(const uint8_t*& p, const uint8_t* end, bool last)` consuming it.
    ///
    /// \c last is true when the value is the final component of the key.
    template <typename T, typename Enable = void>
    struct KeyCodec {
        static_assert(sizeof(T) == 0, "Unsupported key type for KeyCodec");
    };

    template <>
    struct KeyCodec<bool> {
        static void encode(bool key, Bytes& out, bool) {
            out.push_back(key ? 1 : 0);
        }
        static bool decode(const uint8_t*& p, const uint8_t* end, bool) {
            uint8_t b = detail::get_be<uint8_t>(p, end);
            if (b > 1) throw_corrupted("deserialize_key: bad bool key");
            return b == 1;
        }
    };

    template <typename T>
    struct KeyCodec<T, typename std::enable_if<
        std::is_integral<T>::value && !std::is_same<T, bool>::value>::type> {
        using U = typename std::make_unsigned<T>::type;
        static constexpr U sign_mask = std::is_signed<T>::value
            ? static_cast<U>(U(1) << (sizeof(T) * 8 - 1)) : U(0);

        static void encode(T key, Bytes& out, bool) {
            detail::put_be<U>(out, static_cast<U>(static_cast<U>(key) ^ sign_mask));
        }
        static T decode(const uint8_t*& p, const uint8_t* end, bool) {
            return static_cast<T>(static_cast<U>(detail::get_be<U>(p, end) ^ sign_mask));
        }
    };

    template <typename T>
    struct KeyCodec<T, typename std::enable_if<std::is_enum<T>::value>::type> {
        using Base = KeyCodec<typename std::underlying_type<T>::type>;

        static void encode(T key, Bytes& out, bool last) {
            Base::encode(static_cast<typename std::underlying_type<T>::type>(key), out, last);
        }
        static T decode(const uint8_t*& p, const uint8_t* end, bool last) {
            return static_cast<T>(Base::decode(p, end, last));
        }
    };

    template <>
    struct KeyCodec<float> {
        static void encode(float key, Bytes& out, bool) {
            if (key == 0.0f) key = 0.0f;
            detail::put_be<uint32_t>(out, sortable_key_from_float(key));
        }
        static float decode(const uint8_t*& p, const uint8_t* end, bool) {
            return float_from_sortable_key(detail::get_be<uint32_t>(p, end));
        }
    };

    template <>
    struct KeyCodec<double> {
        static void encode(double key, Bytes& out, bool) {
            if (key == 0.0) key = 0.0;
            detail::put_be<uint64_t>(out, sortable_key_from_double(key));
        }
        static double decode(const uint8_t*& p, const uint8_t* end, bool) {
            return double_from_sortable_key(detail::get_be<uint64_t>(p, end));
        }
    };

    template <>
    struct KeyCodec<std::string> {
        static void encode(const std::string& key, Bytes& out, bool last) {
            detail::put_var(out, key.data(), key.size(), last);
        }
        static std::string decode(const uint8_t*& p, const uint8_t* end, bool last) {
            Bytes raw = detail::get_var(p, end, last);
            return std::string(raw.begin(), raw.end());
        }
    };

    template <typename T>
    struct KeyCodec<T, typename std::enable_if<is_byte_vector<T>::value>::type> {
        static void encode(const T& key, Bytes& out, bool last) {
            detail::put_var(out, key.data(), key.size(), last);
        }
        static T decode(const uint8_t*& p, const uint8_t* end, bool last) {
            Bytes raw = detail::get_var(p, end, last);
            return deserialize_value<T>(raw.data(), raw.size());
        }
    };

    template <size_t N>
    struct KeyCodec<std::array<uint8_t, N>> {
        static void encode(const std::array<uint8_t, N>& key, Bytes& out, bool) {
            out.insert(out.end(), key.begin(), key.end());
        }
        static std::array<uint8_t, N> decode(const uint8_t*& p, const uint8_t* end, bool) {
            if (static_cast<size_t>(end - p) < N) {
                throw_corrupted("deserialize_key: truncated fixed-width key");
            }
            std::array<uint8_t, N> key;
            std::memcpy(key.data(), p, N);
            p += N;
            return key;
        }
    };

    /// Types serializing themselves through `to_bytes()` / `from_bytes()`.
    template <typename T>
    struct KeyCodec<T, typename std::enable_if<
        has_to_bytes<T>::value && has_from_bytes<T>::value>::type> {
        static void encode(const T& key, Bytes& out, bool last) {
            const auto bytes = key.to_bytes();
            detail::put_var(out, bytes.data(), bytes.size(), last);
        }
        static T decode(const uint8_t*& p, const uint8_t* end, bool last) {
            Bytes raw = detail::get_var(p, end, last);
            return T::from_bytes(static_cast<const void*>(raw.data()), raw.size());
        }
    };

    template <typename A, typename B>
    struct KeyCodec<std::pair<A, B>> {
        static void encode(const std::pair<A, B>& key, Bytes& out, bool last) {
            KeyCodec<A>::encode(key.first, out, false);
            KeyCodec<B>::encode(key.second, out, last);
        }
        static std::pair<A, B> decode(const uint8_t*& p, const uint8_t* end, bool last) {
            A first = KeyCodec<A>::decode(p, end, false);
            B second = KeyCodec<B>::decode(p, end, last);
            return std::pair<A, B>(std::move(first), std::move(second));
        }
    };

    template <typename... Ts>
    struct KeyCodec<std::tuple<Ts...>> {
        static void encode(const std::tuple<Ts...>& key, Bytes& out, bool last) {
            encode_impl(key, out, last, std::index_sequence_for<Ts...>{});
        }
        static std::tuple<Ts...> decode(const uint8_t*& p, const uint8_t* end, bool last) {
            return decode_impl(p, end, last, std::index_sequence_for<Ts...>{});
        }

    private:
        template <size_t... Is>
        static void encode_impl(const std::tuple<Ts...>& key, Bytes& out, bool last,
                                std::index_sequence<Is...>) {
            (KeyCodec<Ts>::encode(std::get<Is>(key), out, last && Is + 1 == sizeof...(Ts)), ...);
        }

        // braced initialization evaluates the components left to right
        template <size_t... Is>
        static std::tuple<Ts...> decode_impl(const uint8_t*& p, const uint8_t* end, bool last,
                                             std::index_sequence<Is...>) {
            return std::tuple<Ts...>{KeyCodec<Ts>::decode(p, end, last && Is + 1 == sizeof...(Ts))...};
        }
    };

    /// \brief Serializes a key into its canonical byte sequence.
    /// \tparam T Key type.
    /// \param key The key to convert.
    /// \return Bytes compared by providers in memcmp order.
    template <typename T>
    Bytes serialize_key(const T& key) {
        Bytes out;
        KeyCodec<T>::encode(key, out, true);
        return out;
    }

    /// \brief Restores a key from its canonical byte sequence.
    /// \throws TableException (STORAGE_ERROR) if the bytes are malformed.
    template <typename T>
    T deserialize_key(const uint8_t* data, size_t size) {
        const uint8_t* p = data;
        const uint8_t* end = data + size;
        T key = KeyCodec<T>::decode(p, end, true);
        if (p != end) {
            throw_corrupted("deserialize_key: trailing bytes after key");
        }
        return key;
    }

    template <typename T>
    T deserialize_key(const Bytes& bytes) {
        return deserialize_key<T>(bytes.data(), bytes.size());
    }

} // namespace kvt

/// @}

#endif // _KV_TABLES_KEY_CODEC_HPP_INCLUDED
