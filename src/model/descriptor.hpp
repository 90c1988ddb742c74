#pragma once
/// @file descriptor.hpp
/// @brief Loading and validation of the fragment/node descriptor (JSON).
///
/// The descriptor is the only way fragment and node records enter the
/// system. Validation is fail-fast: the planner and the controller never see
/// a malformed record.
///
/// Format:
/// @code
///   {
///     "fragments": [{"id":"f0001","size":4096,"importance":0.9,
///                    "reuse":3,"timescale":"short"}],
///     "nodes": [{"id":0,"capacity_budget":8192,
///                "predicted_interference":0.0,"unit_budget":2,
///                "backing":false}]
///   }
/// @endcode
/// `hbm_budget`, `tlb_budget` and `pred_interference` are accepted as aliases
/// of `capacity_budget`, `unit_budget` and `predicted_interference`.

#include "model/fragment.hpp"

#include <nlohmann/json_fwd.hpp>

#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace frag_res {

/// @brief Reasons a descriptor is rejected.
enum class DescriptorErrc : std::uint8_t {
  Unreadable,   ///< File missing or not readable.
  Syntax,       ///< Not valid JSON.
  MissingField, ///< Required field absent.
  WrongType,    ///< Field present with the wrong JSON type.
  InvalidValue, ///< Field out of range (size <= 0, reuse < 0, ...).
  DuplicateId,  ///< Two fragments or two nodes share an id.
};

/// @brief Human-readable description of a DescriptorErrc.
[[nodiscard]] constexpr auto to_string(DescriptorErrc e) -> const char * {
  switch (e) {
  case DescriptorErrc::Unreadable:
    return "descriptor unreadable";
  case DescriptorErrc::Syntax:
    return "descriptor is not valid JSON";
  case DescriptorErrc::MissingField:
    return "missing field";
  case DescriptorErrc::WrongType:
    return "wrong field type";
  case DescriptorErrc::InvalidValue:
    return "invalid field value";
  case DescriptorErrc::DuplicateId:
    return "duplicate id";
  }
  return "unknown";
}

/// @brief A MalformedDescriptor error with the offending location.
struct DescriptorError {
  DescriptorErrc code;
  std::string detail; ///< e.g. "fragments[3].size".

  [[nodiscard]] auto message() const -> std::string {
    return std::string{to_string(code)} + ": " + detail;
  }
};

/// @brief Validated descriptor contents, in input order.
struct Descriptor {
  std::vector<Fragment> fragments;
  std::vector<Node> nodes;
};

/// @brief Validate an already-parsed JSON document.
[[nodiscard]] auto parse_descriptor(const nlohmann::json &doc)
    -> std::expected<Descriptor, DescriptorError>;

/// @brief Parse and validate descriptor text.
[[nodiscard]] auto parse_descriptor_text(std::string_view text)
    -> std::expected<Descriptor, DescriptorError>;

/// @brief Read, parse and validate a descriptor file.
[[nodiscard]] auto load_descriptor(const std::filesystem::path &path)
    -> std::expected<Descriptor, DescriptorError>;

} // namespace frag_res
