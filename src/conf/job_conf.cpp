#include "split_reader/job_conf.hpp"
#include <algorithm>

namespace sr {

Properties::Properties(std::initializer_list<Entry> init) {
  for (const auto& e : init) set(e.first, e.second);
}

const Properties::Entry* Properties::find(std::string_view key) const noexcept {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const Entry& e){ return e.first == key; });
  return it == entries_.end() ? nullptr : &*it;
}

void Properties::set(std::string key, std::string value) {
  for (auto& e : entries_) {
    if (e.first == key) { e.second = std::move(value); return; }
  }
  entries_.emplace_back(std::move(key), std::move(value));
}

bool Properties::erase(std::string_view key) {
  auto it = std::find_if(entries_.begin(), entries_.end(),
                         [&](const Entry& e){ return e.first == key; });
  if (it == entries_.end()) return false;
  entries_.erase(it);
  return true;
}

bool Properties::contains(std::string_view key) const noexcept {
  return find(key) != nullptr;
}

std::optional<std::string> Properties::get(std::string_view key) const {
  const Entry* e = find(key);
  if (!e) return std::nullopt;
  return e->second;
}

std::string Properties::get_or(std::string_view key, std::string_view def) const {
  const Entry* e = find(key);
  return e ? e->second : std::string(def);
}

bool JobConf::inside_distributed_job() const {
  auto plan = get(keys::kPlan);
  return plan.has_value() && !plan->empty();
}

bool JobConf::apply_override(std::string_view kv) {
  auto eq = kv.find('=');
  if (eq == std::string_view::npos || eq == 0) return false;
  set(std::string(kv.substr(0, eq)), std::string(kv.substr(eq + 1)));
  return true;
}

}
