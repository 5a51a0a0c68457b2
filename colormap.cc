// Copyright 2024 The Diffcov Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      https://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#include "./colormap.h"

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"

namespace diffcov {

namespace {

// Evenly spaced samples of each map, 0xRRGGBB, from t=0 to t=1.
constexpr uint32_t kViridis[] = {0x440154, 0x472C7A, 0x3B518B,
                                 0x2C718E, 0x21908D, 0x27AD81,
                                 0x5CC863, 0xAADC32, 0xFDE725};
constexpr uint32_t kPlasma[] = {0x0D0887, 0x4C02A1, 0x7E03A8,
                                0xA92395, 0xCC4778, 0xE56B5D,
                                0xF89441, 0xFDC328, 0xF0F921};
constexpr uint32_t kMagma[] = {0x000004, 0x1C1044, 0x4F127B,
                               0x812581, 0xB5367A, 0xE55964,
                               0xFB8761, 0xFEC287, 0xFCFDBF};
constexpr uint32_t kInferno[] = {0x000004, 0x1F0C48, 0x550F6D,
                                 0x88226A, 0xBA3655, 0xE35933,
                                 0xF98E09, 0xF9CB35, 0xFCFFA4};
constexpr uint32_t kCividis[] = {0x00224E, 0x123570, 0x3B496C,
                                 0x575D6D, 0x707173, 0x8A8779,
                                 0xA69D75, 0xC4B56C, 0xFEE838};

struct NamedColormap {
  absl::string_view name;
  absl::Span<const uint32_t> anchors;
};

constexpr NamedColormap kColormaps[] = {
    {"viridis", kViridis}, {"plasma", kPlasma},   {"magma", kMagma},
    {"inferno", kInferno}, {"cividis", kCividis},
};

const NamedColormap *FindColormap(absl::string_view name) {
  for (const auto &colormap : kColormaps) {
    if (colormap.name == name) return &colormap;
  }
  return nullptr;
}

Rgb FromHex(uint32_t hex) {
  return {((hex >> 16) & 0xFF) / 255.0, ((hex >> 8) & 0xFF) / 255.0,
          (hex & 0xFF) / 255.0};
}

double Lerp(double a, double b, double f) { return a + (b - a) * f; }

int ToByte(double channel) {
  return static_cast<int>(std::lround(std::clamp(channel, 0.0, 1.0) * 255));
}

}  // namespace

std::vector<std::string> ColormapNames() {
  std::vector<std::string> names;
  for (const auto &colormap : kColormaps) {
    names.emplace_back(colormap.name);
  }
  return names;
}

bool IsKnownColormap(absl::string_view name) {
  return FindColormap(name) != nullptr;
}

absl::StatusOr<Rgb> SampleColormap(absl::string_view name, double t) {
  const NamedColormap *colormap = FindColormap(name);
  if (colormap == nullptr) {
    return absl::InvalidArgumentError(
        absl::StrCat("Invalid colormap: '", name, "'; expected one of ",
                     absl::StrJoin(ColormapNames(), ", ")));
  }
  const auto anchors = colormap->anchors;
  t = std::clamp(t, 0.0, 1.0);
  const double pos = t * static_cast<double>(anchors.size() - 1);
  const size_t lo = std::min(static_cast<size_t>(pos), anchors.size() - 2);
  const double f = pos - static_cast<double>(lo);
  const Rgb a = FromHex(anchors[lo]);
  const Rgb b = FromHex(anchors[lo + 1]);
  return Rgb{Lerp(a.r, b.r, f), Lerp(a.g, b.g, f), Lerp(a.b, b.b, f)};
}

Rgb Lighten(const Rgb &color) {
  constexpr double kKeep = 0.3;
  return {1 - (1 - color.r) * kKeep, 1 - (1 - color.g) * kKeep,
          1 - (1 - color.b) * kKeep};
}

std::string ToHtmlHex(const Rgb &color) {
  return absl::StrFormat("%02X%02X%02X", ToByte(color.r), ToByte(color.g),
                         ToByte(color.b));
}

absl::StatusOr<std::string> ColormapLightHex(double t, absl::string_view name) {
  auto color = SampleColormap(name, t);
  if (!color.ok()) return color.status();
  return ToHtmlHex(Lighten(*color));
}

}  // namespace diffcov
