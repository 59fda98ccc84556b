#pragma once
//
// Glaze serializers for the engine's enums: written and read by name
// through their epoch_core wrappers.
//
#include <epoch_ta/core/constants.h>
#include <glaze/glaze.hpp>
#include <string>

namespace epoch_ta::detail {
template <typename Wrapper> struct EnumToJson {
  template <auto Opts>
  static void op(auto const &value, auto &&...args) {
    const std::string name{Wrapper::ToString(value)};
    glz::serialize<glz::JSON>::op<Opts>(name, args...);
  }
};

template <typename Wrapper> struct EnumFromJson {
  template <auto Opts> static void op(auto &value, auto &&...args) {
    std::string name;
    glz::parse<glz::JSON>::op<Opts>(name, args...);
    value = Wrapper::FromString(name);
  }
};
} // namespace epoch_ta::detail

namespace glz {
template <>
struct to<JSON, epoch_core::SignalDirection>
    : epoch_ta::detail::EnumToJson<epoch_core::SignalDirectionWrapper> {};
template <>
struct from<JSON, epoch_core::SignalDirection>
    : epoch_ta::detail::EnumFromJson<epoch_core::SignalDirectionWrapper> {};

template <>
struct to<JSON, epoch_core::PivotType>
    : epoch_ta::detail::EnumToJson<epoch_core::PivotTypeWrapper> {};
template <>
struct from<JSON, epoch_core::PivotType>
    : epoch_ta::detail::EnumFromJson<epoch_core::PivotTypeWrapper> {};

template <>
struct to<JSON, epoch_core::ResampleRule>
    : epoch_ta::detail::EnumToJson<epoch_core::ResampleRuleWrapper> {};
template <>
struct from<JSON, epoch_core::ResampleRule>
    : epoch_ta::detail::EnumFromJson<epoch_core::ResampleRuleWrapper> {};

template <>
struct to<JSON, epoch_core::ChartType>
    : epoch_ta::detail::EnumToJson<epoch_core::ChartTypeWrapper> {};
template <>
struct from<JSON, epoch_core::ChartType>
    : epoch_ta::detail::EnumFromJson<epoch_core::ChartTypeWrapper> {};
} // namespace glz
