#include <algorithm>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "environment.hpp"

#include <error.hpp>

#include "object.hpp"

environment::environment(environment_ptr parent_env)
    : parent(std::move(parent_env))
{
}

auto environment::find(std::string_view name) const -> std::optional<object>
{
    for (const auto* ptr = this; ptr != nullptr; ptr = ptr->parent.get()) {
        if (const auto itr = ptr->store.find(std::string {name}); itr != ptr->store.end()) {
            return itr->second;
        }
    }
    return std::nullopt;
}

auto environment::get(std::string_view name) const -> object
{
    auto val = find(name);
    if (!val.has_value()) {
        throw make_error<name_error>("identifier not found: {}", name);
    }
    return *std::move(val);
}

auto environment::set(std::string_view name, object val) -> void
{
    store.insert_or_assign(std::string {name}, std::move(val));
}

auto environment::break_cycle() -> void
{
    store.clear();
    auto frames = std::move(root().m_frames);
    for (const auto& weak_frame : frames) {
        if (const auto frame = weak_frame.lock()) {
            frame->store.clear();
        }
    }
}

auto environment::root() -> environment&
{
    auto* env = this;
    while (env->parent) {
        env = env->parent.get();
    }
    return *env;
}

auto environment::track(const environment_ptr& frame) -> void
{
    if (m_frames.size() >= m_prune_at) {
        std::erase_if(m_frames, [](const std::weak_ptr<environment>& weak_frame) { return weak_frame.expired(); });
        m_prune_at = std::max(min_prune_size, m_frames.size() * 2);
    }
    m_frames.push_back(frame);
}

auto make_frame(const environment_ptr& parent_env) -> environment_ptr
{
    auto frame = std::make_shared<environment>(parent_env);
    frame->root().track(frame);
    return frame;
}
