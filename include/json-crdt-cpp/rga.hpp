/// @file rga.hpp
/// @brief Replicated Growable Array: the sequence engine behind string,
/// binary and array nodes.

#pragma once

#include <json-crdt-cpp/types.hpp>
#include <json-crdt-cpp/utf8.hpp>
#include <json-crdt-cpp/value.hpp>

#include <algorithm>
#include <cassert>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ranges>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace json_crdt_cpp {

// -- Chunk payloads -----------------------------------------------------------

/// Per-payload item counting and splitting. Offsets are item offsets, never
/// byte offsets.
template <typename T>
struct ChunkTraits;

/// Character runs: UTF-8 text, one item per code point.
template <>
struct ChunkTraits<std::string> {
    static auto length(const std::string& s) -> std::uint64_t { return utf8::length(s); }

    // Keep the first `at` items in `s`, return the rest.
    static auto split(std::string& s, std::uint64_t at) -> std::string {
        auto off = utf8::offset(s, static_cast<std::size_t>(at));
        auto tail = s.substr(off);
        s.resize(off);
        return tail;
    }
};

/// Byte runs.
template <>
struct ChunkTraits<Bytes> {
    static auto length(const Bytes& b) -> std::uint64_t { return b.size(); }

    static auto split(Bytes& b, std::uint64_t at) -> Bytes {
        auto tail = Bytes(b.begin() + static_cast<std::ptrdiff_t>(at), b.end());
        b.resize(static_cast<std::size_t>(at));
        return tail;
    }
};

/// Reference runs: array elements are node ids.
template <>
struct ChunkTraits<std::vector<Timestamp>> {
    static auto length(const std::vector<Timestamp>& v) -> std::uint64_t { return v.size(); }

    static auto split(std::vector<Timestamp>& v, std::uint64_t at) -> std::vector<Timestamp> {
        auto tail = std::vector<Timestamp>(v.begin() + static_cast<std::ptrdiff_t>(at), v.end());
        v.resize(static_cast<std::size_t>(at));
        return tail;
    }
};

template <typename T>
concept ChunkPayload = requires(T& data, const T& cdata, std::uint64_t at) {
    { ChunkTraits<T>::length(cdata) } -> std::convertible_to<std::uint64_t>;
    { ChunkTraits<T>::split(data, at) } -> std::same_as<T>;
};

// -- Chunk --------------------------------------------------------------------

/// A contiguous run of items inserted by one operation.
///
/// Item `k` of the chunk has id `(id.sid, id.time + k)`. A deleted chunk
/// is a tombstone and carries no payload.
template <typename T>
struct Chunk {
    Timestamp id;
    std::uint64_t span{0};
    bool deleted{false};
    std::optional<T> data;

    auto contains(Timestamp ts) const -> bool {
        return ts.sid == id.sid && ts.time >= id.time && ts.time - id.time < span;
    }

    auto operator==(const Chunk&) const -> bool = default;
};

// -- Rga ----------------------------------------------------------------------

/// An ordered list of chunks in document order.
///
/// The visible content is the concatenation of live chunk payloads.
/// Lookups scan linearly.
template <ChunkPayload T>
class Rga {
public:
    using chunk_type = Chunk<T>;

    /// All chunks, tombstones included, in document order.
    auto iter() const -> const std::vector<Chunk<T>>& { return chunks_; }

    /// Live chunks in document order.
    auto iter_live() const {
        return chunks_ | std::views::filter([](const Chunk<T>& c) { return !c.deleted; });
    }

    auto chunk_count() const -> std::size_t { return chunks_.size(); }

    auto at(std::size_t index) -> Chunk<T>& {
        assert(index < chunks_.size());
        return chunks_[index];
    }

    auto at(std::size_t index) const -> const Chunk<T>& {
        assert(index < chunks_.size());
        return chunks_[index];
    }

    /// Index of the chunk containing `id`.
    auto find_by_id(Timestamp id) const -> std::optional<std::size_t> {
        for (std::size_t i = 0; i < chunks_.size(); ++i) {
            if (chunks_[i].contains(id)) return i;
        }
        return std::nullopt;
    }

    /// Chunk index and item offset of `id`.
    auto locate(Timestamp id) const -> std::optional<std::pair<std::size_t, std::uint64_t>> {
        auto idx = find_by_id(id);
        if (!idx) return std::nullopt;
        return std::pair{*idx, id.time - chunks_[*idx].id.time};
    }

    /// Insert `span` items identified from `id`, right after item `after`.
    ///
    /// `origin` anchors at the head. Among chunks already following the
    /// anchor, those with a greater id stay closer to it. Inserting an id
    /// that is already present, or after an unknown anchor, does nothing.
    /// @return true if a chunk was inserted.
    auto insert(Timestamp after, Timestamp id, std::uint64_t span, T data) -> bool {
        if (span == 0 || find_by_id(id)) return false;
        auto pos = std::size_t{0};
        if (after != origin) {
            auto loc = locate(after);
            if (!loc) return false;
            auto [idx, off] = *loc;
            if (off + 1 < chunks_[idx].span) split(idx, off + 1);
            pos = idx + 1;
        }
        while (pos < chunks_.size() && chunks_[pos].id > id) ++pos;
        chunks_.insert(chunks_.begin() + static_cast<std::ptrdiff_t>(pos),
                       Chunk<T>{.id = id, .span = span, .deleted = false, .data = std::move(data)});
        return true;
    }

    /// Tombstone every item covered by `spans`.
    void del(std::span<const Timespan> spans) {
        for (const auto& s : spans) del(s);
    }

    /// Tombstone every item covered by `s`. Already deleted items are left alone.
    void del(const Timespan& s) {
        if (s.span == 0) return;
        const auto end = s.time + s.span;
        for (std::size_t i = 0; i < chunks_.size(); ++i) {
            const auto& c = chunks_[i];
            if (c.id.sid != s.sid || c.deleted) continue;
            const auto c_start = c.id.time;
            const auto c_end = c.id.time + c.span;
            if (c_end <= s.time || c_start >= end) continue;
            if (c_start < s.time) {
                // The overlapping tail becomes chunk i + 1, visited next.
                split(i, s.time - c_start);
                continue;
            }
            if (c_end > end) split(i, end - c_start);
            auto& target = chunks_[i];
            target.deleted = true;
            target.data.reset();
        }
    }

    /// Append a chunk known to follow every existing chunk in document order.
    void push_chunk(Chunk<T> chunk) {
        chunks_.push_back(std::move(chunk));
    }

    /// Split chunk `index` so that its first `offset` items stay in place
    /// and the rest become a new chunk right after it.
    void split(std::size_t index, std::uint64_t offset) {
        assert(index < chunks_.size());
        auto& c = chunks_[index];
        assert(offset > 0 && offset < c.span);
        auto tail = Chunk<T>{
            .id = Timestamp{c.id.sid, c.id.time + offset},
            .span = c.span - offset,
            .deleted = c.deleted,
            .data = std::nullopt,
        };
        if (c.data) tail.data = ChunkTraits<T>::split(*c.data, offset);
        c.span = offset;
        chunks_.insert(chunks_.begin() + static_cast<std::ptrdiff_t>(index) + 1, std::move(tail));
    }

    /// Number of live items.
    auto size() const -> std::uint64_t {
        auto n = std::uint64_t{0};
        for (const auto& c : iter_live()) n += c.span;
        return n;
    }

    /// Id of the live item at position `pos`.
    auto find(std::uint64_t pos) const -> std::optional<Timestamp> {
        for (const auto& c : iter_live()) {
            if (pos < c.span) return Timestamp{c.id.sid, c.id.time + pos};
            pos -= c.span;
        }
        return std::nullopt;
    }

    /// Timespans covering `len` live items starting at position `pos`.
    auto find_interval(std::uint64_t pos, std::uint64_t len) const -> std::vector<Timespan> {
        auto result = std::vector<Timespan>{};
        for (const auto& c : iter_live()) {
            if (len == 0) break;
            if (pos >= c.span) {
                pos -= c.span;
                continue;
            }
            auto take = std::min(c.span - pos, len);
            result.push_back(tss(c.id.sid, c.id.time + pos, take));
            len -= take;
            pos = 0;
        }
        return result;
    }

    /// Ids of all live items, one per item, in document order.
    auto live_ids() const -> std::vector<Timestamp> {
        auto result = std::vector<Timestamp>{};
        for (const auto& c : iter_live()) {
            for (std::uint64_t k = 0; k < c.span; ++k) {
                result.emplace_back(c.id.sid, c.id.time + k);
            }
        }
        return result;
    }

    auto operator==(const Rga&) const -> bool = default;

private:
    std::vector<Chunk<T>> chunks_;
};

}  // namespace json_crdt_cpp
