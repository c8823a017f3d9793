#pragma once
#ifndef _KV_TABLES_BOX_HPP_INCLUDED
#define _KV_TABLES_BOX_HPP_INCLUDED

/// \file Box.hpp
/// \brief Ownership wrapper around values stored in a table.

namespace kvt {

    template <class KeyT, class ValueT>
    class Table;

    /// \class Box
    /// \ingroup kvt_core
    /// \brief Single-field wrapper marking a value as owned by a table.
    ///
    /// A value is boxed when it enters a table (add, or the insert path of
    /// upsert) and unboxed when it leaves it (remove). Reads and in-place
    /// edits work on the stored bytes through peek() and pack() and never
    /// construct a Box. Everything except the layout tag is private: only
    /// Table can create, decode or unwrap a Box.
    ///
    /// Stored layout: one tag byte (\ref TAG) followed by the value codec bytes.
    /// Providers see the same wrapper layout regardless of the value type.
    template <class ValueT>
    class Box {
        template <class, class> friend class Table;
    public:
        static constexpr uint8_t TAG = 0xB0; ///< First byte of every stored value.

        Box(const Box&) = delete;
        Box& operator=(const Box&) = delete;
        Box(Box&&) = default;
        Box& operator=(Box&&) = default;
        ~Box() = default;

    private:
        ValueT m_value;

        explicit Box(ValueT value) : m_value(std::move(value)) {}

        /// \brief Moves the value out; the box is consumed.
        ValueT unwrap() && {
            return std::move(m_value);
        }

        Bytes to_bytes() const {
            return pack(m_value);
        }

        static Box from_bytes(const Bytes& bytes) {
            return Box(peek(bytes));
        }

        /// \throws TableException STORAGE_ERROR if \a bytes do not start with \ref TAG.
        static void check_tag(const Bytes& bytes) {
            if (bytes.empty() || bytes[0] != TAG) {
                throw_corrupted("stored value is not boxed");
            }
        }

        /// \brief Decodes a copy of the value held in stored bytes.
        static ValueT peek(const Bytes& bytes) {
            check_tag(bytes);
            return deserialize_value<ValueT>(bytes.data() + 1, bytes.size() - 1);
        }

        /// \brief Encodes \a value in the stored layout.
        static Bytes pack(const ValueT& value) {
            Bytes out;
            out.push_back(TAG);
            serialize_value(value, out);
            return out;
        }
    };

} // namespace kvt

#endif // _KV_TABLES_BOX_HPP_INCLUDED
