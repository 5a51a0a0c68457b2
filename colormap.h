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

// Perceptually uniform colormaps for LaTeX cell backgrounds.

#ifndef THIRD_PARTY_DIFFCOV_COLORMAP_H_
#define THIRD_PARTY_DIFFCOV_COLORMAP_H_

#include <string>
#include <vector>

#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"

namespace diffcov {

struct Rgb {
  double r = 0;
  double g = 0;
  double b = 0;
};

// Names of the supported colormaps, in a fixed order.
std::vector<std::string> ColormapNames();

bool IsKnownColormap(absl::string_view name);

// Samples colormap `name` at `t`, clamped to [0, 1], by linear interpolation
// between the map's anchor colors.
// Returns InvalidArgument for an unknown colormap.
absl::StatusOr<Rgb> SampleColormap(absl::string_view name, double t);

// Moves every channel of `color` 70% of the way towards white, so that black
// text stays readable on top of it.
Rgb Lighten(const Rgb &color);

// "RRGGBB", upper case, as taken by \cellcolor[HTML]{...}.
std::string ToHtmlHex(const Rgb &color);

// ToHtmlHex(Lighten(SampleColormap(name, t))).
absl::StatusOr<std::string> ColormapLightHex(double t, absl::string_view name);

}  // namespace diffcov

#endif  // THIRD_PARTY_DIFFCOV_COLORMAP_H_
