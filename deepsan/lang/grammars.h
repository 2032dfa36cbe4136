// Copyright 2026 The Deep Sanitizer Authors.
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//      http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

// Entry points of the tree-sitter grammars deepsan links against.

#ifndef DEEPSAN_LANG_GRAMMARS_H_
#define DEEPSAN_LANG_GRAMMARS_H_

#include <tree_sitter/api.h>

extern "C" {
// From tree-sitter-typescript; parses JavaScript too.
const TSLanguage *tree_sitter_typescript();
// TypeScript with JSX; also used for plain JSX.
const TSLanguage *tree_sitter_tsx();
const TSLanguage *tree_sitter_python();
}

#endif  // DEEPSAN_LANG_GRAMMARS_H_
