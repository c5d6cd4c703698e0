/// @file model.hpp
/// @brief The Model class -- a replica of a JSON CRDT document.

#pragma once

#include <json-crdt-cpp/clock.hpp>
#include <json-crdt-cpp/nodes.hpp>
#include <json-crdt-cpp/op.hpp>
#include <json-crdt-cpp/patch.hpp>
#include <json-crdt-cpp/patch_builder.hpp>
#include <json-crdt-cpp/types.hpp>
#include <json-crdt-cpp/value.hpp>

#include <nlohmann/json.hpp>

#include <concepts>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <utility>

namespace json_crdt_cpp {

namespace detail {
struct ModelState;
}  // namespace detail

/// Which clock a model allocates ids from.
enum class ClockKind : std::uint8_t {
    logical,  ///< Per-replica vector clock, random or explicit session id.
    server,   ///< Shared server clock, session::server.
};

/// Construction options for a Model.
struct ModelOptions {
    std::optional<std::uint64_t> sid{};  ///< Logical session id; random if unset.
    ClockKind clock{ClockKind::logical};
    std::uint64_t server_time{1};        ///< Starting time of a server clock.
};

/// A replica of a JSON CRDT document.
///
/// A Model owns a flat graph of CRDT nodes keyed by Timestamp, a root
/// register and a clock. It changes only by applying patches; applying is
/// idempotent, commutative for concurrent patches, and never fails on ops
/// that reference unknown or mismatched nodes (those are skipped).
///
/// A Model is a plain value: it is not internally synchronized.
///
/// @code
/// auto doc = Model{};
/// auto patch = doc.edit([](PatchBuilder& b) {
///     b.root(b.json({{"title", "hello"}}));
/// });
/// // send `patch` to other replicas, which call apply_patch(patch)
/// auto view = doc.view();  // {"title": "hello"}
/// @endcode
class Model {
public:
    /// Construct an empty model with a logical clock and a random session id.
    Model();

    /// Construct an empty model with a logical clock for session `sid`.
    explicit Model(std::uint64_t sid);

    explicit Model(const ModelOptions& options);

    ~Model();

    Model(Model&&) noexcept;
    auto operator=(Model&&) noexcept -> Model&;

    /// Deep-copy a model. The copy keeps the same session id.
    Model(const Model&);
    auto operator=(const Model&) -> Model&;

    // -- Identity -------------------------------------------------------------

    auto clock_kind() const -> ClockKind;

    /// Session id new ops are allocated under.
    auto sid() const -> std::uint64_t;

    /// Next logical time the local session will allocate.
    auto time() const -> std::uint64_t;

    auto clock() const -> const Clock&;

    // -- Mutation -------------------------------------------------------------

    /// Apply every op of `patch` in order.
    /// @throws Error (clock_overflow) if an op's span overflows the clock.
    void apply_patch(const Patch& patch);

    void apply_op(const Op& op);

    /// A builder positioned at this model's clock.
    auto builder() const -> PatchBuilder;

    /// Build a patch with `fn`, apply it locally and return it.
    template <typename Fn>
        requires std::invocable<Fn, PatchBuilder&>
    auto edit(Fn&& fn) -> Patch {
        auto b = builder();
        std::forward<Fn>(fn)(b);
        auto patch = b.flush();
        apply_patch(patch);
        return patch;
    }

    // -- Reading --------------------------------------------------------------

    /// The JSON view of the whole document. An empty document views as null.
    ///
    /// Binary nodes view as JSON binary values, constant references as
    /// `[sid, time]`, missing or undefined nodes as null. Object keys whose
    /// winning child is undefined are omitted.
    auto view() const -> nlohmann::json;

    /// The JSON view of the subtree rooted at node `id`.
    auto view(Timestamp id) const -> nlohmann::json;

    /// The node the root register points at, or origin if never set.
    auto root() const -> Timestamp;

    /// Look up a node by id. The pointer is valid until the next mutation.
    auto node(Timestamp id) const -> const Node*;

    auto node_count() const -> std::size_t;

    // -- Forking --------------------------------------------------------------

    /// Independent copy under a new session id (random if unset).
    ///
    /// A server model forks into another server model at the same time.
    auto fork(std::optional<std::uint64_t> sid = std::nullopt) const -> Model;

    // -- Binary format --------------------------------------------------------

    /// Serialize the document: node tree plus clock.
    auto to_binary() const -> Bytes;

    /// Load a document written by to_binary().
    /// @throws Error on malformed input.
    static auto from_binary(std::span<const std::byte> data) -> Model;

private:
    explicit Model(std::unique_ptr<detail::ModelState> state);

    std::unique_ptr<detail::ModelState> state_;
};

}  // namespace json_crdt_cpp
