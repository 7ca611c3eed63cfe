#include "marrow/marrow.hpp"
#include "marrow/log.hpp"
#include "marrow/relations.hpp"
#include "marrow/skeleton_query.hpp"

namespace marrow {

// Single definition of the global log level (declared extern in log.hpp).
std::atomic<log_level> g_log_level{log_level::warn};

marrow_db::marrow_db(const schema_registry& registry, configuration config)
    : config_(std::move(config)), registry_(registry) {
    if (!registry_.is_sealed()) {
        throw schema_error("The schema registry must be sealed before a marrow_db is opened");
    }
    store_ = std::make_unique<entity_store>(config_);
    queue_ = std::make_unique<store_task_queue>(*store_, config_.task_max_attempts);
    relations_ = std::make_unique<relation_propagation>(*this);
    queue_->set_handler([this](const task& t) { relations_->dispatch(t); });
    LOG_INFO("marrow", "Opened %s with %zu kinds", config_.path.c_str(), registry_.kinds().size());
}

marrow_db::~marrow_db() = default;

skeleton_instance marrow_db::create(const std::string& kind) {
    return skeleton_instance(*this, registry_.get(kind));
}

std::optional<skeleton_instance> marrow_db::load(const db_key& key) {
    skeleton_instance skel(*this, registry_.get(key.kind()));
    if (!skel.read(key)) return std::nullopt;
    return skel;
}

skeleton_query marrow_db::select(const std::string& kind) {
    return skeleton_query(*this, registry_.get(kind));
}

} // namespace marrow
