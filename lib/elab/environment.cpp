// shimbridge/elab/environment.cpp - Elaboration state of one host compilation unit
#include "shimbridge/elab/environment.hpp"

#include <algorithm>
#include <utility>

namespace shimbridge
{

namespace
{

std::string join_prefix(const std::vector<std::string> & parts, size_t count)
{
  std::string out;
  for (size_t i = 0; i < count; ++i) {
    if (!out.empty()) {
      out += '.';
    }
    out += parts[i];
  }
  return out;
}

std::string qualified(const std::string & prefix, std::string_view name)
{
  if (prefix.empty()) {
    return std::string(name);
  }
  return prefix + "." + std::string(name);
}

}  // namespace

Environment::Environment(SourceFile host, ProjectConfig config)
: host_(std::move(host)), config_(std::move(config))
{
}

DiagnosticBuilder Environment::report_error(
  SourceRange range, std::string message, const char * code)
{
  auto builder = diags_.report_error(range, std::move(message));
  builder.with_code(code).with_file(host_.path().string());
  return builder;
}

DiagnosticBuilder Environment::report_warning(
  SourceRange range, std::string message, const char * code)
{
  auto builder = diags_.report_warning(range, std::move(message));
  builder.with_code(code).with_file(host_.path().string());
  return builder;
}

const ShimBuffer & Environment::shim_buffer()
{
  if (!shim_) {
    shim_.emplace();
    for (const auto & line : config_.boundary.prelude) {
      shim_->push_command(line, SourceRange{});
    }
  }
  return *shim_;
}

void Environment::push_shim_command(std::string_view text, SourceRange origin)
{
  (void)shim_buffer();
  shim_->push_command(text, origin);
}

ElaborationState Environment::save_state() const
{
  return ElaborationState{shim_, boundaries_, declarations_, namespaces_, opened_};
}

void Environment::restore_state(ElaborationState state)
{
  shim_ = std::move(state.shim);
  boundaries_ = std::move(state.boundaries);
  declarations_ = std::move(state.declarations);
  namespaces_ = std::move(state.namespaces);
  opened_ = std::move(state.opened);
}

void Environment::record_boundary(const std::string & resolved_name, BoundaryEntry entry)
{
  boundaries_[resolved_name] = std::move(entry);
}

const BoundaryEntry * Environment::find_boundary(std::string_view resolved_name) const
{
  const auto it = boundaries_.find(resolved_name);
  return it == boundaries_.end() ? nullptr : &it->second;
}

void Environment::import_declaration(std::string full_name)
{
  declarations_.insert(std::move(full_name));
}

bool Environment::declare_opaque(const std::string & full_name)
{
  return declarations_.insert(full_name).second;
}

bool Environment::is_declared(std::string_view full_name) const
{
  return declarations_.find(full_name) != declarations_.end();
}

std::string Environment::qualify(std::string_view name) const
{
  return qualified(current_namespace(), name);
}

std::vector<std::string> Environment::resolve_global_name(std::string_view name) const
{
  std::vector<std::string> found;
  const auto add = [&found](std::string candidate) {
    if (std::find(found.begin(), found.end(), candidate) == found.end()) {
      found.push_back(std::move(candidate));
    }
  };

  for (size_t depth = namespaces_.size() + 1; depth-- > 0;) {
    std::string candidate = qualified(join_prefix(namespaces_, depth), name);
    if (is_declared(candidate)) {
      add(std::move(candidate));
      break;
    }
  }

  for (const auto & ns : opened_) {
    std::string candidate = qualified(ns, name);
    if (is_declared(candidate)) {
      add(std::move(candidate));
    }
  }
  return found;
}

void Environment::push_namespace(std::string name) { namespaces_.push_back(std::move(name)); }

bool Environment::pop_namespace()
{
  if (namespaces_.empty()) {
    return false;
  }
  namespaces_.pop_back();
  return true;
}

std::string Environment::current_namespace() const
{
  return join_prefix(namespaces_, namespaces_.size());
}

void Environment::open_namespace(std::string name)
{
  if (std::find(opened_.begin(), opened_.end(), name) == opened_.end()) {
    opened_.push_back(std::move(name));
  }
}

}  // namespace shimbridge
