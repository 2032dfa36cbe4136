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

#include "deepsan/sanitizer/reserved-names.h"

#include <ostream>
#include <string>
#include <vector>

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "absl/strings/string_view.h"
#include "absl/types/span.h"
#include "deepsan/common/util/enum-flags.h"

namespace deepsan {

static const EnumNameMap<WhitelistMode> &WhitelistModeNames() {
  static const EnumNameMap<WhitelistMode> kNames({
      {"append", WhitelistMode::kAppend},
      {"overwrite", WhitelistMode::kOverwrite},
  });
  return kNames;
}

std::ostream &operator<<(std::ostream &stream, WhitelistMode mode) {
  return WhitelistModeNames().Unparse(mode, stream);
}

absl::StatusOr<WhitelistMode> ParseWhitelistMode(absl::string_view text) {
  WhitelistMode mode;
  std::string error;
  if (!WhitelistModeNames().Parse(text, &mode, &error, "whitelist mode")) {
    return absl::InvalidArgumentError(error);
  }
  return mode;
}

absl::Span<const absl::string_view> DefaultReservedNames() {
  static constexpr absl::string_view kNames[] = {
      // Script globals and common members.
      "console", "window", "document", "globalThis", "self", "navigator",
      "location", "history", "localStorage", "sessionStorage", "process",
      "require", "module", "exports", "__dirname", "__filename", "arguments",
      "undefined", "NaN", "Infinity", "Object", "Array", "String", "Number",
      "Boolean", "Symbol", "BigInt", "Math", "JSON", "Date", "RegExp",
      "Error", "TypeError", "RangeError", "Promise", "Map", "Set", "WeakMap",
      "WeakSet", "Proxy", "Reflect", "Intl", "URL", "URLSearchParams",
      "fetch", "Response", "Request", "Headers", "FormData", "Blob", "File",
      "Event", "HTMLElement", "Element", "Node", "parseInt", "parseFloat",
      "isNaN", "isFinite", "setTimeout", "clearTimeout", "setInterval",
      "clearInterval", "requestAnimationFrame", "queueMicrotask",
      "structuredClone", "encodeURIComponent", "decodeURIComponent",
      "constructor", "prototype", "length", "toString", "valueOf", "then",
      // TypeScript contextual keywords and built-in types.
      "type", "async", "get", "set", "of", "as", "from", "declare",
      "namespace", "readonly", "abstract", "implements", "keyof", "infer",
      "is", "satisfies", "override", "accessor", "asserts", "unique", "any",
      "unknown", "never", "string", "number", "boolean", "symbol", "object",
      "bigint", "Partial", "Required", "Readonly", "Record", "Pick", "Omit",
      "Exclude", "Extract", "NonNullable", "ReturnType", "Parameters",
      "Awaited",
      // React.
      "React", "ReactDOM", "Fragment", "Component", "PureComponent",
      "useState", "useEffect", "useContext", "useReducer", "useCallback",
      "useMemo", "useRef", "useLayoutEffect", "useImperativeHandle",
      "useDebugValue", "useId", "useTransition", "useDeferredValue",
      "useSyncExternalStore", "createContext", "forwardRef", "memo", "lazy",
      "Suspense", "render", "componentDidMount", "componentDidUpdate",
      "componentWillUnmount", "shouldComponentUpdate",
      "getDerivedStateFromProps", "getSnapshotBeforeUpdate",
      "componentDidCatch", "setState", "forceUpdate", "state", "children",
      "key", "ref", "className",
      // Python built-ins and soft keywords.
      "cls", "print", "len", "range", "str", "int", "float", "complex",
      "bool", "bytes", "list", "dict", "tuple", "frozenset", "super", "open", "input", "isinstance", "issubclass", "enumerate",
      "zip", "map", "filter", "sorted", "reversed", "min", "max", "sum",
      "abs", "all", "id", "iter", "next", "repr", "hash", "format",
      "getattr", "setattr", "hasattr", "delattr", "vars", "dir", "callable",
      "property", "staticmethod", "classmethod", "Exception", "ValueError",
      "KeyError", "IndexError", "RuntimeError", "NotImplementedError",
      "StopIteration", "match", "case",
      "__init__", "__new__", "__name__", "__main__", "__file__", "__doc__",
      "__all__", "__call__", "__repr__", "__str__", "__eq__", "__hash__",
      "__len__", "__iter__", "__enter__", "__exit__", "__getattr__",
      "__getitem__", "__setitem__", "__post_init__",
  };
  return kNames;
}

ReservedSet::ReservedSet(const std::vector<std::string> &whitelist,
                         WhitelistMode mode) {
  if (mode == WhitelistMode::kAppend) {
    for (const absl::string_view name : DefaultReservedNames()) {
      names_.emplace(name);
    }
  }
  names_.insert(whitelist.begin(), whitelist.end());
}

}  // namespace deepsan
