#include <json-crdt-cpp/model.hpp>
#include <json-crdt-cpp/logging.hpp>

#include "model_state.hpp"
#include "storage/model_codec.hpp"

namespace json_crdt_cpp {

namespace {

auto make_clock(const ModelOptions& options) -> Clock {
    if (options.clock == ClockKind::server) return ServerClockVector{options.server_time};
    return ClockVector{options.sid.value_or(random_session_id()), 1};
}

}  // anonymous namespace

Model::Model()
    : state_{std::make_unique<detail::ModelState>(make_clock(ModelOptions{}))} {}

Model::Model(std::uint64_t sid)
    : state_{std::make_unique<detail::ModelState>(make_clock(ModelOptions{.sid = sid}))} {}

Model::Model(const ModelOptions& options)
    : state_{std::make_unique<detail::ModelState>(make_clock(options))} {}

Model::Model(std::unique_ptr<detail::ModelState> state)
    : state_{std::move(state)} {}

Model::~Model() = default;

Model::Model(Model&& other) noexcept = default;
auto Model::operator=(Model&& other) noexcept -> Model& = default;

Model::Model(const Model& other)
    : state_{std::make_unique<detail::ModelState>(*other.state_)} {}

auto Model::operator=(const Model& other) -> Model& {
    if (this != &other) {
        state_ = std::make_unique<detail::ModelState>(*other.state_);
    }
    return *this;
}

// -- Identity -----------------------------------------------------------------

auto Model::clock_kind() const -> ClockKind {
    return std::holds_alternative<ServerClockVector>(state_->clock) ? ClockKind::server
                                                                    : ClockKind::logical;
}

auto Model::sid() const -> std::uint64_t { return state_->sid(); }

auto Model::time() const -> std::uint64_t { return state_->time(); }

auto Model::clock() const -> const Clock& { return state_->clock; }

// -- Mutation -----------------------------------------------------------------

void Model::apply_patch(const Patch& patch) {
    for (const auto& op : patch.ops) state_->apply(op);
}

void Model::apply_op(const Op& op) {
    state_->apply(op);
}

auto Model::builder() const -> PatchBuilder {
    return PatchBuilder{state_->sid(), state_->time()};
}

// -- Reading ------------------------------------------------------------------

auto Model::view() const -> nlohmann::json { return state_->view(); }

auto Model::view(Timestamp id) const -> nlohmann::json { return state_->view(id); }

auto Model::root() const -> Timestamp { return state_->root.value; }

auto Model::node(Timestamp id) const -> const Node* { return state_->get(id); }

auto Model::node_count() const -> std::size_t { return state_->index.size(); }

// -- Forking ------------------------------------------------------------------

auto Model::fork(std::optional<std::uint64_t> sid) const -> Model {
    auto copy = std::make_unique<detail::ModelState>(*state_);
    if (const auto* cv = std::get_if<ClockVector>(&state_->clock)) {
        auto new_sid = sid.value_or(random_session_id());
        while (new_sid == cv->sid()) new_sid = random_session_id();
        copy->clock = cv->fork(new_sid);
    }
    logger()->debug("forked model {} at time {}", copy->sid(), copy->time());
    return Model{std::move(copy)};
}

// -- Binary format ------------------------------------------------------------

auto Model::to_binary() const -> Bytes {
    return storage::encode_model(*state_);
}

auto Model::from_binary(std::span<const std::byte> data) -> Model {
    return Model{storage::decode_model(data)};
}

}  // namespace json_crdt_cpp
