/// @file descriptor.cpp
/// @brief Descriptor parsing and validation.

#include "model/descriptor.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <initializer_list>
#include <set>
#include <sstream>
#include <string>

namespace frag_res {

namespace {

using nlohmann::json;

auto fail(DescriptorErrc code, std::string detail)
    -> std::unexpected<DescriptorError> {
  return std::unexpected(DescriptorError{code, std::move(detail)});
}

/// First present key among @p names (aliases), or nullptr.
auto find_field(const json &obj, std::initializer_list<const char *> names)
    -> const json * {
  for (const auto *name : names) {
    auto it = obj.find(name);
    if (it != obj.end()) {
      return &*it;
    }
  }
  return nullptr;
}

auto parse_fragment(const json &obj, const std::string &where)
    -> std::expected<Fragment, DescriptorError> {
  if (!obj.is_object()) {
    return fail(DescriptorErrc::WrongType, where);
  }

  Fragment f{};

  const auto *id = find_field(obj, {"id"});
  if (id == nullptr) {
    return fail(DescriptorErrc::MissingField, where + ".id");
  }
  if (!id->is_string()) {
    return fail(DescriptorErrc::WrongType, where + ".id");
  }
  f.id = id->get<std::string>();
  if (f.id.empty()) {
    return fail(DescriptorErrc::InvalidValue, where + ".id");
  }

  const auto *size = find_field(obj, {"size"});
  if (size == nullptr) {
    return fail(DescriptorErrc::MissingField, where + ".size");
  }
  if (!size->is_number_integer()) {
    return fail(DescriptorErrc::WrongType, where + ".size");
  }
  if (size->is_number_unsigned()) {
    f.size = size->get<std::uint64_t>();
  } else if (size->get<std::int64_t>() > 0) {
    f.size = static_cast<std::uint64_t>(size->get<std::int64_t>());
  } else {
    f.size = 0;
  }
  if (f.size == 0) {
    return fail(DescriptorErrc::InvalidValue, where + ".size");
  }

  const auto *importance = find_field(obj, {"importance"});
  if (importance == nullptr) {
    return fail(DescriptorErrc::MissingField, where + ".importance");
  }
  if (!importance->is_number()) {
    return fail(DescriptorErrc::WrongType, where + ".importance");
  }
  f.importance = importance->get<double>();

  const auto *reuse = find_field(obj, {"reuse"});
  if (reuse == nullptr) {
    return fail(DescriptorErrc::MissingField, where + ".reuse");
  }
  if (!reuse->is_number_integer()) {
    return fail(DescriptorErrc::WrongType, where + ".reuse");
  }
  if (!reuse->is_number_unsigned() && reuse->get<std::int64_t>() < 0) {
    return fail(DescriptorErrc::InvalidValue, where + ".reuse");
  }
  f.reuse = reuse->get<std::uint64_t>();

  // Informational only; tolerated when absent.
  const auto *timescale = find_field(obj, {"timescale"});
  if (timescale != nullptr) {
    if (!timescale->is_string()) {
      return fail(DescriptorErrc::WrongType, where + ".timescale");
    }
    f.timescale = timescale->get<std::string>();
  }

  return f;
}

auto parse_node(const json &obj, const std::string &where)
    -> std::expected<Node, DescriptorError> {
  if (!obj.is_object()) {
    return fail(DescriptorErrc::WrongType, where);
  }

  Node n{};

  const auto *id = find_field(obj, {"id"});
  if (id == nullptr) {
    return fail(DescriptorErrc::MissingField, where + ".id");
  }
  if (!id->is_number_integer()) {
    return fail(DescriptorErrc::WrongType, where + ".id");
  }
  if (!id->is_number_unsigned() && id->get<std::int64_t>() < 0) {
    return fail(DescriptorErrc::InvalidValue, where + ".id");
  }
  n.id = id->get<NodeId>();

  const auto *backing = find_field(obj, {"backing"});
  if (backing != nullptr) {
    if (!backing->is_boolean()) {
      return fail(DescriptorErrc::WrongType, where + ".backing");
    }
    n.backing = backing->get<bool>();
  }

  const auto *budget = find_field(obj, {"capacity_budget", "hbm_budget"});
  if (budget == nullptr) {
    // A backing store has no budget of its own.
    if (!n.backing) {
      return fail(DescriptorErrc::MissingField, where + ".capacity_budget");
    }
  } else {
    if (!budget->is_number_integer()) {
      return fail(DescriptorErrc::WrongType, where + ".capacity_budget");
    }
    if (!budget->is_number_unsigned() || budget->get<std::uint64_t>() == 0) {
      return fail(DescriptorErrc::InvalidValue, where + ".capacity_budget");
    }
    n.capacity_budget = budget->get<std::uint64_t>();
  }

  const auto *interference =
      find_field(obj, {"predicted_interference", "pred_interference"});
  if (interference != nullptr) {
    if (!interference->is_number()) {
      return fail(DescriptorErrc::WrongType,
                  where + ".predicted_interference");
    }
    n.predicted_interference = interference->get<double>();
    if (n.predicted_interference < 0.0) {
      return fail(DescriptorErrc::InvalidValue,
                  where + ".predicted_interference");
    }
  }

  const auto *units = find_field(obj, {"unit_budget", "tlb_budget"});
  if (units != nullptr) {
    if (!units->is_number_integer()) {
      return fail(DescriptorErrc::WrongType, where + ".unit_budget");
    }
    if (!units->is_number_unsigned() || units->get<std::uint64_t>() == 0) {
      return fail(DescriptorErrc::InvalidValue, where + ".unit_budget");
    }
    n.unit_budget = units->get<std::uint64_t>();
  }

  return n;
}

} // namespace

auto parse_descriptor(const json &doc)
    -> std::expected<Descriptor, DescriptorError> {
  if (!doc.is_object()) {
    return fail(DescriptorErrc::WrongType, "<root>");
  }

  const auto *fragments = find_field(doc, {"fragments"});
  if (fragments == nullptr) {
    return fail(DescriptorErrc::MissingField, "fragments");
  }
  if (!fragments->is_array()) {
    return fail(DescriptorErrc::WrongType, "fragments");
  }

  const auto *nodes = find_field(doc, {"nodes"});
  if (nodes == nullptr) {
    return fail(DescriptorErrc::MissingField, "nodes");
  }
  if (!nodes->is_array()) {
    return fail(DescriptorErrc::WrongType, "nodes");
  }

  Descriptor out;
  out.fragments.reserve(fragments->size());
  out.nodes.reserve(nodes->size());

  std::set<FragmentId> seen_fragments;
  for (std::size_t i = 0; i < fragments->size(); ++i) {
    auto where = "fragments[" + std::to_string(i) + "]";
    auto f = parse_fragment((*fragments)[i], where);
    if (!f.has_value()) {
      return std::unexpected(f.error());
    }
    if (!seen_fragments.insert(f->id).second) {
      return fail(DescriptorErrc::DuplicateId, where + ".id = " + f->id);
    }
    out.fragments.push_back(std::move(*f));
  }

  std::set<NodeId> seen_nodes;
  for (std::size_t i = 0; i < nodes->size(); ++i) {
    auto where = "nodes[" + std::to_string(i) + "]";
    auto n = parse_node((*nodes)[i], where);
    if (!n.has_value()) {
      return std::unexpected(n.error());
    }
    if (!seen_nodes.insert(n->id).second) {
      return fail(DescriptorErrc::DuplicateId,
                  where + ".id = " + std::to_string(n->id));
    }
    out.nodes.push_back(*n);
  }

  return out;
}

auto parse_descriptor_text(std::string_view text)
    -> std::expected<Descriptor, DescriptorError> {
  auto doc = json::parse(text, nullptr, /*allow_exceptions=*/false);
  if (doc.is_discarded()) {
    return fail(DescriptorErrc::Syntax, "<input>");
  }
  return parse_descriptor(doc);
}

auto load_descriptor(const std::filesystem::path &path)
    -> std::expected<Descriptor, DescriptorError> {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return fail(DescriptorErrc::Unreadable, path.string());
  }
  std::ostringstream ss;
  ss << file.rdbuf();

  auto result = parse_descriptor_text(ss.str());
  if (!result.has_value() && result.error().code == DescriptorErrc::Syntax) {
    return fail(DescriptorErrc::Syntax, path.string());
  }
  return result;
}

} // namespace frag_res
