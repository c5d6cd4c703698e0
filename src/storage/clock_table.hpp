#pragma once

// Clock table: the list of (sid, time) bases a binary document encodes its
// ids against. An id is written as (table index, base.time - id.time).
// Internal header — not installed.

#include <json-crdt-cpp/clock.hpp>
#include <json-crdt-cpp/error.hpp>
#include <json-crdt-cpp/types.hpp>
#include "reader.hpp"
#include "writer.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace json_crdt_cpp::storage {

struct ClockTableEntry {
    std::uint64_t sid;
    std::uint64_t time;

    auto operator==(const ClockTableEntry&) const -> bool = default;
};

class ClockTable {
public:
    ClockTable() = default;

    // Local session first, at the clock's next time, then every peer.
    static auto from_clock(const ClockVector& clock) -> ClockTable {
        auto table = ClockTable{};
        table.entries_.push_back({.sid = clock.sid(), .time = clock.time()});
        for (const auto& [sid, peer] : clock.peers()) {
            table.entries_.push_back({.sid = sid, .time = peer.time});
        }
        return table;
    }

    // Make sure `span` ticks from `id` can be encoded.
    void observe(Timestamp id, std::uint64_t span) {
        const auto edge = span == 0 ? id.time : id.time + span - 1;
        if (auto idx = index_of(id.sid)) {
            if (entries_[*idx].time < edge) entries_[*idx].time = edge;
            return;
        }
        entries_.push_back({.sid = id.sid, .time = edge});
    }

    auto index_of(std::uint64_t sid) const -> std::optional<std::size_t> {
        for (std::size_t i = 0; i < entries_.size(); ++i) {
            if (entries_[i].sid == sid) return i;
        }
        return std::nullopt;
    }

    auto entries() const -> const std::vector<ClockTableEntry>& { return entries_; }

    // Rebuild the vector clock the table was written from.
    auto to_clock() const -> ClockVector {
        auto clock = ClockVector{entries_.front().sid, entries_.front().time};
        for (std::size_t i = 1; i < entries_.size(); ++i) {
            if (entries_[i].sid == session::system) continue;
            clock.observe(Timestamp{entries_[i].sid, entries_[i].time}, 1);
        }
        return clock;
    }

    void encode(Writer& w) const {
        w.write_vu57(entries_.size());
        for (const auto& e : entries_) {
            w.write_vu57(e.sid);
            w.write_vu57(e.time);
        }
    }

    // Returns nullopt on an empty or truncated table.
    static auto decode(Reader& r) -> std::optional<ClockTable> {
        auto len = r.read_vu57();
        if (!len || *len == 0) return std::nullopt;
        auto table = ClockTable{};
        for (std::uint64_t i = 0; i < *len; ++i) {
            auto sid = r.read_vu57();
            if (!sid) return std::nullopt;
            auto time = r.read_vu57();
            if (!time) return std::nullopt;
            table.entries_.push_back({.sid = *sid, .time = *time});
        }
        return table;
    }

    // Single byte `index << 4 | diff` when both are small, otherwise
    // b1vu56(1, index) followed by vu57(diff).
    void write_id(Writer& w, Timestamp id) const {
        auto idx = index_of(id.sid);
        if (!idx || entries_[*idx].time < id.time) {
            throw Error{ErrorKind::encoding_error,
                        "id " + to_string(id) + " is not covered by the clock table"};
        }
        const auto diff = entries_[*idx].time - id.time;
        if (*idx <= 0b111 && diff <= 0b1111) {
            w.write_u8(static_cast<std::uint8_t>((*idx << 4) | diff));
        } else {
            w.write_b1vu56(true, *idx);
            w.write_vu57(diff);
        }
    }

    auto read_id(Reader& r) const -> std::optional<Timestamp> {
        auto first = r.peek_u8();
        if (!first) return std::nullopt;
        std::uint64_t idx = 0;
        std::uint64_t diff = 0;
        if (*first <= 0x7F) {
            r.read_u8();
            idx = *first >> 4;
            diff = *first & 0x0F;
        } else {
            auto head = r.read_b1vu56();
            if (!head) return std::nullopt;
            auto d = r.read_vu57();
            if (!d) return std::nullopt;
            idx = head->value;
            diff = *d;
        }
        if (idx >= entries_.size() || diff > entries_[idx].time) return std::nullopt;
        const auto& base = entries_[static_cast<std::size_t>(idx)];
        return Timestamp{base.sid, base.time - diff};
    }

private:
    std::vector<ClockTableEntry> entries_;
};

}  // namespace json_crdt_cpp::storage
