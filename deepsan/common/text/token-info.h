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

#ifndef DEEPSAN_COMMON_TEXT_TOKEN_INFO_H_
#define DEEPSAN_COMMON_TEXT_TOKEN_INFO_H_

#include <functional>
#include <iosfwd>
#include <iterator>
#include <string>
#include <utility>

#include "absl/strings/string_view.h"

namespace deepsan {

// Symbol 0 is end-of-input in every tree-sitter grammar.
constexpr int TK_EOF = 0;

// TokenInfo describes the text and location of a syntax node or token.
// Reminder: The text string_view doesn't own its memory, so the owner must
// always out-live the token.
class TokenInfo {
 public:
  // Construct an EOF token that points to the end of a string buffer.
  static TokenInfo EOFToken(absl::string_view buffer);

  TokenInfo() = delete;

  TokenInfo(int token_enum, absl::string_view text)
      : token_enum_(token_enum), text_(text) {}

  TokenInfo(const TokenInfo &) = default;
  TokenInfo(TokenInfo &&) = default;
  TokenInfo &operator=(const TokenInfo &) = default;

  // Context contains the information needed to display meaningful information
  // about a TokenInfo.
  struct Context {
    // Full range of text in which a token appears.
    // This is used to calculate byte offsets.
    absl::string_view base;

    // Prints a human-readable interpretation form of a token enumeration.
    std::function<void(std::ostream &, int)> token_enum_translator;

    explicit Context(absl::string_view b);

    Context(absl::string_view b,
            std::function<void(std::ostream &, int)> translator)
        : base(b), token_enum_translator(std::move(translator)) {}
  };

  int token_enum() const { return token_enum_; }
  absl::string_view text() const { return text_; }

  // Return position of this token's text start relative to a base buffer.
  int left(absl::string_view base) const {
    return std::distance(base.begin(), text_.begin());
  }

  // Return position of this token's text end relative to a base buffer.
  int right(absl::string_view base) const {
    return std::distance(base.begin(), text_.end());
  }

  // Writes a human-readable string representation of the token.
  std::ostream &ToStream(std::ostream &, const Context &context) const;

  // Prints token representation without byte offsets.
  std::ostream &ToStream(std::ostream &) const;

  std::string ToString() const;

  // Equal enums and the same buffer range.  All EOF tokens are equal.
  bool operator==(const TokenInfo &token) const;
  bool operator!=(const TokenInfo &token) const { return !(*this == token); }

  // Returns true if tokens are considered equivalent, ignoring location.
  bool EquivalentWithoutLocation(const TokenInfo &token) const {
    return token_enum_ == token.token_enum_ &&
           (token_enum_ == TK_EOF || text_ == token.text_);
  }

  bool isEOF() const { return token_enum_ == TK_EOF; }

 private:
  int token_enum_;

  // The substring of a larger text that this token represents.
  absl::string_view text_;
};

std::ostream &operator<<(std::ostream &, const TokenInfo &);

// Streamable structure that combines a token with its detailed context.
struct TokenWithContext {
  TokenInfo token;
  TokenInfo::Context context;
};

std::ostream &operator<<(std::ostream &, const TokenWithContext &);

}  // namespace deepsan

#endif  // DEEPSAN_COMMON_TEXT_TOKEN_INFO_H_
