/*
 * Copyright 2022 SiFive, Inc.
 *
 * Licensed under the Apache License, Version 2.0 (the "License");
 * you may not use this file except in compliance with the License.
 * You should have received a copy of LICENSE.Apache2 along with
 * this software. If not, you may obtain a copy at
 *
 *    https://www.apache.org/licenses/LICENSE-2.0
 *
 * Unless required by applicable law or agreed to in writing, software
 * distributed under the License is distributed on an "AS IS" BASIS,
 * WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
 * See the License for the specific language governing permissions and
 * limitations under the License.
 */

#pragma once

#include <string>
#include <vector>

#include "ast.h"

// Width-unaware, single line rendering of syntax tree nodes with canonical
// spacing. The width-aware renderers fall back to these for every node they
// do not lay out themselves.

namespace tyfmt {
namespace pprust {

std::string lifetime_to_string(const ast::Lifetime &lifetime);

// 'a or 'a: 'b + 'c
std::string lifetime_def_to_string(const ast::LifetimeDef &def);

std::string ty_to_string(const ast::Ty &ty);

// Type paths never print the `::` some expressions need before `<`
std::string path_to_string(const ast::Path &path);
std::string segment_to_string(const ast::PathSegment &segment);

// <T as Trait>::Item, or <T>::Item when position is zero
std::string qpath_to_string(const ast::QSelf &qself, const ast::Path &path);

// Trait + 'a + ?Sized
std::string bounds_to_string(const std::vector<ast::TyParamBound> &bounds);
std::string bound_to_string(const ast::TyParamBound &bound);

// for<'a> Fn(&'a T)
std::string poly_trait_ref_to_string(const ast::PolyTraitRef &poly);

}  // namespace pprust
}  // namespace tyfmt
