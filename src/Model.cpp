#include "dynalias/Model.hpp"

#include <algorithm>
#include <string>

namespace dynalias {

namespace {

std::string const EMPTY_ALIAS;

} // namespace

auto CommandNode::alias() const -> std::string const& {
  return aliases_.empty() ? EMPTY_ALIAS : aliases_.front();
}

auto chain_root(Chain const& chain) -> CommandNode const* {
  return chain.empty() ? nullptr : chain.front();
}

auto chain_is_strict(Chain const& chain) -> bool {
  auto const* root = chain_root(chain);
  return root != nullptr && root->kind_ == NodeKind::Command && root->strict_;
}

auto chain_timeout(Chain const& chain) -> int {
  auto const* root = chain_root(chain);
  return root != nullptr && root->kind_ == NodeKind::Command ? root->timeout_ : 0;
}

auto chain_helper_type(Chain const& chain) -> HelperType {
  auto const* root = chain_root(chain);
  return root != nullptr && root->kind_ == NodeKind::Command ? root->helper_type_ : HelperType::Auto;
}

auto chain_sets_locals(Chain const& chain) -> bool {
  return std::ranges::any_of(chain, [](CommandNode const* node) { return node->set_locals_; });
}

auto chain_template(Chain const& chain) -> std::string {
  std::string out;
  for (size_t i = 0; i < chain.size(); ++i) {
    if (i > 0) {
      out.push_back(' ');
    }
    out += chain[i]->command_;
  }
  return out;
}

auto Model::find_static(std::string_view name) const -> StaticSource const* {
  auto it = std::ranges::find(statics_, name, &StaticSource::name_);
  return it == statics_.end() ? nullptr : &*it;
}

auto Model::find_dynamic(std::string_view name) const -> DynamicSource const* {
  auto it = std::ranges::find(dynamics_, name, &DynamicSource::name_);
  return it == dynamics_.end() ? nullptr : &*it;
}

auto Model::ttl_map() const -> std::unordered_map<std::string, std::int64_t> {
  std::unordered_map<std::string, std::int64_t> ttls;
  for (auto const& source : dynamics_) {
    ttls.emplace(source.name_, source.cache_ttl_);
  }
  return ttls;
}

} // namespace dynalias
