// Copyright 2024 Robert A. Dunnagan
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.
#pragma once

#include <pdsl/core/Identifier.h>
#include <pdsl/core/Units.h>
#include <pdsl/core/Numeric.h>
#include <pdsl/core/Temporal.h>
#include <pdsl/core/Text.h>
#include <pdsl/core/Scalar.h>
#include <pdsl/core/Value.h>
#include <pdsl/core/Statement.h>
#include <pdsl/core/serialize.h>
#include <pdsl/parser/odl.h>
#include <pdsl/fmt_support.h>
