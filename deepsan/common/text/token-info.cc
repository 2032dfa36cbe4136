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

#include "deepsan/common/text/token-info.h"

#include <ostream>
#include <sstream>
#include <string>

#include "absl/strings/escaping.h"
#include "absl/strings/string_view.h"

namespace deepsan {

TokenInfo TokenInfo::EOFToken(absl::string_view buffer) {
  return {TK_EOF, buffer.substr(buffer.length())};
}

bool TokenInfo::operator==(const TokenInfo &token) const {
  return token_enum_ == token.token_enum_ &&
         (token_enum_ == TK_EOF ||  // All EOF tokens considered equal.
          (text_.data() == token.text_.data() &&
           text_.length() == token.text_.length()));
}

TokenInfo::Context::Context(absl::string_view b)
    : base(b),
      // By default, just print the enum integer value, un-translated.
      token_enum_translator([](std::ostream &stream, int e) { stream << e; }) {}

std::ostream &TokenInfo::ToStream(std::ostream &output_stream,
                                  const Context &context) const {
  output_stream << "(#";
  context.token_enum_translator(output_stream, token_enum_);
  return output_stream << " @" << left(context.base) << '-'
                       << right(context.base) << ": \""
                       << absl::CEscape(text_) << "\")";
}

std::ostream &TokenInfo::ToStream(std::ostream &output_stream) const {
  return output_stream << "(#" << token_enum_ << ": \"" << absl::CEscape(text_)
                       << "\")";
}

std::string TokenInfo::ToString() const {
  std::ostringstream output_stream;
  ToStream(output_stream);
  return output_stream.str();
}

std::ostream &operator<<(std::ostream &stream, const TokenInfo &token) {
  return token.ToStream(stream);
}

std::ostream &operator<<(std::ostream &stream, const TokenWithContext &t) {
  return t.token.ToStream(stream, t.context);
}

}  // namespace deepsan
