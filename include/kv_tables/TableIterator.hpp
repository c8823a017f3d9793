#pragma once
#ifndef _KV_TABLES_TABLE_ITERATOR_HPP_INCLUDED
#define _KV_TABLES_TABLE_ITERATOR_HPP_INCLUDED

/// \file TableIterator.hpp
/// \brief Bounded range cursor over the entries of a Table.

#include "common.hpp"

namespace kvt {

    template<class KeyT, class ValueT>
    class Table;

    /// \class TableIterator
    /// \ingroup kvt_tables
    /// \brief Finite, non-restartable sequence of entries with keys in [start, end).
    ///
    /// Entries are consumed with a two-step protocol: prepare() moves the
    /// provider cursor and reports whether an entry is available, next()
    /// reads it. try_next() performs both steps in one call.
    ///
    /// \code
    /// auto it = table.iter(10, 20);
    /// while (it.prepare()) {
    ///     auto [key, value] = it.next();
    /// }
    /// \endcode
    ///
    /// \warning The iterator must not outlive its table, and the table must
    /// not be modified while the iterator is open.
    template<class KeyT, class ValueT>
    class TableIterator {
    public:
        using value_type = std::pair<KeyT, ValueT>;

        TableIterator(const TableIterator&) = delete;
        TableIterator& operator=(const TableIterator&) = delete;

        TableIterator(TableIterator&& other) noexcept
            : m_provider(std::move(other.m_provider)),
              m_cursor(other.m_cursor),
              m_direction(other.m_direction),
              m_ready(other.m_ready),
              m_exhausted(other.m_exhausted) {
            other.m_cursor = 0;
            other.m_ready = false;
        }

        TableIterator& operator=(TableIterator&& other) noexcept {
            if (this != &other) {
                close();
                m_provider = std::move(other.m_provider);
                m_cursor = other.m_cursor;
                m_direction = other.m_direction;
                m_ready = other.m_ready;
                m_exhausted = other.m_exhausted;
                other.m_cursor = 0;
                other.m_ready = false;
            }
            return *this;
        }

        /// \brief Closes the provider cursor.
        ~TableIterator() {
            close();
        }

        /// \brief Advances to the next entry within the bounds.
        /// \return false once the range is exhausted; later calls keep returning false.
        /// \throws TableException USAGE_ERROR if the iterator was moved from.
        bool prepare() {
            StorageProvider& provider = checked_provider();
            if (m_exhausted) return false;
            m_ready = provider.advance(m_cursor);
            if (!m_ready) {
                m_exhausted = true;
                KVT_LOG_DEBUG("cursor {} exhausted", m_cursor);
            }
            return m_ready;
        }

        /// \brief Returns the entry found by the preceding prepare().
        /// \throws TableException USAGE_ERROR unless the last call was a successful prepare().
        value_type next() {
            StorageProvider& provider = checked_provider();
            if (!m_ready) {
                throw TableException(TableErrc::USAGE_ERROR,
                    m_exhausted ? "next() called on an exhausted iterator"
                                : "next() called without a successful prepare()");
            }
            m_ready = false;
            auto entry = provider.read(m_cursor);
            return value_type(deserialize_key<KeyT>(entry.first),
                              Table<KeyT, ValueT>::read_value(entry.second));
        }

        /// \brief Advances and reads in a single call.
        /// \return The next entry, or std::nullopt when exhausted.
        std::optional<value_type> try_next() {
            if (!prepare()) return std::nullopt;
            return next();
        }

        /// \brief Traversal order of this iterator.
        Direction direction() const noexcept {
            return m_direction;
        }

    private:
        friend class Table<KeyT, ValueT>;

        std::shared_ptr<StorageProvider> m_provider;
        CursorId  m_cursor = 0;
        Direction m_direction = Direction::ASCENDING;
        bool m_ready = false;     ///< Set by a successful prepare(), cleared by next().
        bool m_exhausted = false;

        TableIterator(std::shared_ptr<StorageProvider> provider, CursorId cursor, Direction direction)
            : m_provider(std::move(provider)), m_cursor(cursor), m_direction(direction) {}

        StorageProvider& checked_provider() const {
            if (!m_provider) {
                throw TableException(TableErrc::USAGE_ERROR, "iterator was moved from");
            }
            return *m_provider;
        }

        void close() noexcept {
            if (!m_provider) return;
            m_provider->close_cursor(m_cursor);
            m_provider.reset();
        }
    };

} // namespace kvt

#endif // _KV_TABLES_TABLE_ITERATOR_HPP_INCLUDED
