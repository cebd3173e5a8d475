/* -*- mode: c++; c-basic-offset: 2; indent-tabs-mode: nil; -*-
 * (c) 2026 The FixG Authors
 *
 * This file is part of FixG.
 *
 * FixG is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * FixG is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with FixG.  If not, see <http://www.gnu.org/licenses/>.
 */
#ifndef _FIXG_BLOCK_PARSER_H
#define _FIXG_BLOCK_PARSER_H

/*
 * Streaming tokenizer for G-code blocks. Characters go in one at a time (or
 * in chunks of any size), callbacks on a BlockBuilder come out. No line is
 * ever buffered and no memory is allocated.
 *
 *   BlockBuilder  - callbacks to be implemented by the user.
 *   BlockParser   - the state machine feeding the builder.
 *   BlockError    - what went wrong, and where.
 *
 * Grammar understood:
 *
 *   /           block delete, first character of a block.
 *   %           program delimiter line. Next word starts a new program.
 *   N10  :10    sequence number, first word of a block. ':' marks an
 *               alignment block (restart point).
 *   G1  M3      G- and M-codes.
 *   X-1.5       address letter with value.
 *   R1=2.5      indexed address: letter, unsigned index, '=', value.
 *   (...)  ;... comments, skipped.
 *   *71         XOR checksum of all characters of the block before '*'.
 *
 * Lower case letters are accepted as upper case unless configured otherwise.
 * Whitespace can separate letter and value, but ends a started value.
 */

#include <stddef.h>
#include <stdint.h>

#include <string_view>

#include "gcode-parser/decimal.h"
#include "gcode-parser/significand.h"

namespace fixg {

enum class BlockErrorKind {
  kNone = 0,
  kInvalidCharacter,     // Character not allowed at this point of the block.
  kMisplacedWord,        // Sequence number that is not first in the block.
  kUnterminatedComment,  // Block or input ended within '(' comment.
  kChecksum,             // Checksum given with '*' did not match.
  kDecimal,              // The number of a word could not be parsed.
  kBuilder,              // The BlockBuilder returned an error.
};

// Name for messages, e.g. "InvalidCharacter".
const char *BlockErrorKindName(BlockErrorKind kind);

// Where and why parsing stopped. Everything but the builder's own error
// payload, so that it can be formatted without knowing the builder.
struct BlockErrorInfo {
  BlockErrorKind kind = BlockErrorKind::kNone;
  DecimalError decimal_error = DecimalError::kNone;  // Set with kDecimal.
  char address = '\0';    // Address letter of the word in progress, or '\0'
  char character = '\0';  // The character that was being processed.
  uint32_t line = 0;      // 1-based, saturates.
  uint32_t column = 0;    // 1-based, saturates. For a word without a valid
                          // number, the column of its address letter.
};

template <typename E>
struct BlockError : public BlockErrorInfo {
  E builder_error = E();  // Set with kBuilder.
};

// Writes a one-line description such as
// "3:7: Decimal (Capacity) in word 'X' at '5'" into "buffer".
// Returns the length the full string would have, like snprintf().
int FormatBlockError(const BlockErrorInfo &error, char *buffer, size_t size);

// Callbacks, called in the order the elements appear in the input.
//
// Each returns 'true' to continue. To abort parsing, return 'false' and fill
// "error"; the parser stops right away and hands the error back to the
// caller of Feed() in BlockError::builder_error.
template <typename S, typename E = int>
class BlockBuilder {
public:
  typedef S SignificandType;
  typedef E ErrorType;

  virtual ~BlockBuilder() {}

  // Before any other callback of a program. Use for initialization.
  virtual bool program_start(E *error) = 0;

  // N- or ':' word. "alignment" is true if written with ':'.
  virtual bool sequence_number(bool alignment, Decimal<S> number,
                               E *error) = 0;

  virtual bool g_code(Decimal<S> number, E *error) = 0;
  virtual bool m_code(Decimal<S> number, E *error) = 0;

  // Any other word. "address" is the upper case letter. "index" points to
  // the index of an indexed address (e.g. the 1 in R1=5) or is nullptr.
  // It is only valid during the call.
  virtual bool data(char address, const S *index, Decimal<S> number,
                    E *error) = 0;

  // A block, that had any words or a block delete, ended.
  virtual bool end_block(E *error) = 0;

  // The block started with '/'. It is up to the builder to decide whether
  // to skip the following words.
  virtual bool block_delete(E *error) { return true; }
};

struct BlockParserConfig {
  bool accept_lowercase = true;   // 'g1x5' is the same as 'G1X5'
  bool verify_checksum = true;    // Fail block on '*' checksum mismatch.
};

template <typename S, typename E = int,
          typename Traits = SignificandTraits<S>>
class BlockParser {
public:
  typedef BlockBuilder<S, E> Builder;
  typedef BlockParserConfig Config;

  BlockParser() : BlockParser(Config()) {}
  explicit BlockParser(const Config &config) : config_(config) { Reset(); }

  // Feed the next character. Returns 'false' on error; the error is then
  // available via error(). All following calls return 'false' until Reset()
  // or SkipBlock() is called.
  bool Feed(char c, Builder *builder);

  // Feed all characters of "str". Stops at the first error. Chunking of the
  // input has no influence on the callbacks.
  bool Feed(std::string_view str, Builder *builder) {
    for (const char c : str) {
      if (!Feed(c, builder)) return false;
    }
    return true;
  }

  // End of input. Terminates a last block that did not end in a newline.
  bool Finish(Builder *builder) {
    if (state_ == STATE_FAILED) return false;
    if (state_ == STATE_BLOCK_START && !block_has_content_) return true;
    return Feed('\n', builder);
  }

  // Start over: forget the error and any partial block. The next word starts
  // a new program. Line counting restarts.
  void Reset();

  // Discard the remainder of the current line (or nothing, if the error
  // happened at the end of a line) and continue with the next block of the
  // same program.
  void SkipBlock() {
    error_ = BlockError<E>();
    ResetBlock();
    if (!at_line_start_) state_ = STATE_SKIP_LINE;
  }

  const BlockError<E> &error() const { return error_; }
  bool failed() const { return state_ == STATE_FAILED; }

  // Position of the last character fed.
  uint32_t line() const { return line_; }
  uint32_t column() const { return column_; }

private:
  friend class BlockParserTestPeer;

  enum State {
    STATE_BLOCK_START,     // Nothing but blanks, comments or '/' yet.
    STATE_BETWEEN_WORDS,
    STATE_ADDRESS,         // Letter (or '=' of an indexed one) seen.
    STATE_VALUE,           // Within the number of a word.
    STATE_COMMENT,         // Within '(' ... ')'
    STATE_LINE_COMMENT,    // After ';'
    STATE_CHECKSUM,        // After '*'
    STATE_AFTER_CHECKSUM,
    STATE_PROGRAM_MARKER,  // In a '%' line
    STATE_SKIP_LINE,
    STATE_FAILED,
  };

  enum WordKind {
    WORD_SEQUENCE,
    WORD_G,
    WORD_M,
    WORD_DATA,
  };

  bool Process(char c, Builder *builder);
  bool ProcessBetweenWords(char c, Builder *builder);
  bool StartWord(char c);
  bool EndWord(char c, Builder *builder);
  bool EndBlock(char c, Builder *builder);
  bool EnsureProgramStarted(char c, Builder *builder);

  void ResetBlock() {
    state_ = STATE_BLOCK_START;
    block_has_content_ = false;
    checksum_seen_ = false;
    checksum_digits_ = 0;
    computed_checksum_ = 0;
    declared_checksum_ = 0;
  }

  bool Fail(BlockErrorKind kind, char c) {
    error_.kind = kind;
    error_.address = (state_ == STATE_ADDRESS || state_ == STATE_VALUE)
      ? address_ : '\0';
    error_.character = c;
    error_.line = line_;
    error_.column = column_;
    state_ = STATE_FAILED;
    return false;
  }
  bool FailDecimal(DecimalError err, char c) {
    error_.decimal_error = err;
    return Fail(BlockErrorKind::kDecimal, c);
  }
  bool FailBuilder(const E &err, char c) {
    error_.builder_error = err;
    return Fail(BlockErrorKind::kBuilder, c);
  }

  const Config config_;
  State state_;
  State comment_return_state_;
  BlockError<E> error_;

  uint32_t line_;
  uint32_t column_;
  bool at_line_start_;

  bool program_started_;
  bool block_has_content_;

  // Word in progress.
  WordKind word_kind_;
  char address_;
  uint32_t word_column_;  // Column of the address letter.
  bool has_index_;
  S index_;
  DecimalParser<S, Traits> decimal_;

  bool checksum_seen_;
  int checksum_digits_;
  uint8_t computed_checksum_;
  uint32_t declared_checksum_;
};

template <typename S, typename E, typename Traits>
void BlockParser<S, E, Traits>::Reset() {
  error_ = BlockError<E>();
  ResetBlock();
  comment_return_state_ = STATE_BLOCK_START;
  line_ = 0;
  column_ = 0;
  at_line_start_ = true;
  program_started_ = false;
  word_kind_ = WORD_DATA;
  address_ = '\0';
  word_column_ = 0;
  has_index_ = false;
  index_ = S();
  decimal_.Reset();
}

template <typename S, typename E, typename Traits>
bool BlockParser<S, E, Traits>::Feed(char c, Builder *builder) {
  if (state_ == STATE_FAILED) return false;

  if (at_line_start_) {
    if (line_ < UINT32_MAX) ++line_;
    column_ = 0;
  }
  if (column_ < UINT32_MAX) ++column_;
  at_line_start_ = (c == '\n');

  // The checksum covers everything before the '*'. If this happens to be the
  // '*' starting the checksum, it is taken out again when recognized.
  if (!checksum_seen_ && c != '\n' && c != '\r') {
    computed_checksum_ ^= (uint8_t)c;
  }

  return Process(c, builder);
}

template <typename S, typename E, typename Traits>
bool BlockParser<S, E, Traits>::Process(char c, Builder *builder) {
  bool again;
  do {
    again = false;
    switch (state_) {
    case STATE_BLOCK_START:
    case STATE_BETWEEN_WORDS:
      return ProcessBetweenWords(c, builder);

    case STATE_ADDRESS:
      if (c == ' ' || c == '\t') return true;
      if ((c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.') {
        state_ = STATE_VALUE;
        again = true;
        break;
      }
      // Anything else: there is no number. EndWord() reports it.
      if (!EndWord(c, builder)) return false;
      again = true;
      break;

    case STATE_VALUE:
      if ((c >= '0' && c <= '9') || c == '+' || c == '-' || c == '.') {
        const DecimalError err = decimal_.Feed(c);
        if (err != DecimalError::kNone) return FailDecimal(err, c);
        return true;
      }
      if (c == '=') {
        if (word_kind_ != WORD_DATA || has_index_
            || !decimal_.IsPlainInteger()) {
          return Fail(BlockErrorKind::kInvalidCharacter, c);
        }
        Decimal<S> index;
        const DecimalError err = decimal_.Finish(&index);
        if (err != DecimalError::kNone) return FailDecimal(err, c);
        index_ = index.significand();
        has_index_ = true;
        decimal_.Reset();
        state_ = STATE_ADDRESS;
        return true;
      }
      if (!EndWord(c, builder)) return false;
      again = true;
      break;

    case STATE_COMMENT:
      if (c == ')') {
        state_ = comment_return_state_;
      } else if (c == '\n') {
        return Fail(BlockErrorKind::kUnterminatedComment, c);
      }
      return true;

    case STATE_LINE_COMMENT:
      if (c == '\n') return EndBlock(c, builder);
      return true;

    case STATE_CHECKSUM:
      if (c >= '0' && c <= '9') {
        // Saturate; anything beyond a byte is a mismatch anyway.
        declared_checksum_ = declared_checksum_ * 10 + (c - '0');
        if (declared_checksum_ > 0xffff) declared_checksum_ = 0xffff;
        ++checksum_digits_;
        return true;
      }
      if (checksum_digits_ == 0) {
        return Fail(BlockErrorKind::kInvalidCharacter, c);
      }
      state_ = STATE_AFTER_CHECKSUM;
      again = true;
      break;

    case STATE_AFTER_CHECKSUM:
      switch (c) {
      case ' ': case '\t': case '\r':
        return true;
      case '(':
        comment_return_state_ = STATE_AFTER_CHECKSUM;
        state_ = STATE_COMMENT;
        return true;
      case ';':
        state_ = STATE_LINE_COMMENT;
        return true;
      case '\n':
        return EndBlock(c, builder);
      default:
        return Fail(BlockErrorKind::kInvalidCharacter, c);
      }

    case STATE_PROGRAM_MARKER:
    case STATE_SKIP_LINE:
      if (c == '\n') ResetBlock();
      return true;

    case STATE_FAILED:
      return false;
    }
  } while (again);
  return true;
}

template <typename S, typename E, typename Traits>
bool BlockParser<S, E, Traits>::ProcessBetweenWords(char c,
                                                    Builder *builder) {
  const bool at_block_start = (state_ == STATE_BLOCK_START);
  switch (c) {
  case ' ': case '\t': case '\r':
    return true;

  case '\n':
    return EndBlock(c, builder);

  case '(':
    comment_return_state_ = state_;
    state_ = STATE_COMMENT;
    return true;

  case ';':
    state_ = STATE_LINE_COMMENT;
    return true;

  case '*':
    computed_checksum_ ^= (uint8_t)'*';  // Not part of its own checksum.
    checksum_seen_ = true;
    state_ = STATE_CHECKSUM;
    return true;

  case '/':
    if (!at_block_start || block_has_content_) {
      return Fail(BlockErrorKind::kInvalidCharacter, c);
    }
    if (!EnsureProgramStarted(c, builder)) return false;
    block_has_content_ = true;
    {
      E err = E();
      if (!builder->block_delete(&err)) return FailBuilder(err, c);
    }
    return true;

  case '%':
    if (!at_block_start || block_has_content_) {
      return Fail(BlockErrorKind::kInvalidCharacter, c);
    }
    program_started_ = false;
    state_ = STATE_PROGRAM_MARKER;
    return true;

  default:
    return StartWord(c);
  }
}

template <typename S, typename E, typename Traits>
bool BlockParser<S, E, Traits>::StartWord(char c) {
  char letter = c;
  if (letter >= 'a' && letter <= 'z') {
    if (!config_.accept_lowercase) {
      return Fail(BlockErrorKind::kInvalidCharacter, c);
    }
    letter = letter - 'a' + 'A';
  }
  if (letter != ':' && (letter < 'A' || letter > 'Z')) {
    return Fail(BlockErrorKind::kInvalidCharacter, c);
  }

  switch (letter) {
  case ':': case 'N':
    if (state_ != STATE_BLOCK_START) {
      return Fail(BlockErrorKind::kMisplacedWord, c);
    }
    word_kind_ = WORD_SEQUENCE;
    break;
  case 'G': word_kind_ = WORD_G; break;
  case 'M': word_kind_ = WORD_M; break;
  default:  word_kind_ = WORD_DATA; break;
  }

  address_ = letter;
  word_column_ = column_;
  has_index_ = false;
  block_has_content_ = true;
  decimal_.Reset();
  state_ = STATE_ADDRESS;
  return true;
}

template <typename S, typename E, typename Traits>
bool BlockParser<S, E, Traits>::EndWord(char c, Builder *builder) {
  Decimal<S> number;
  const DecimalError decimal_err = decimal_.Finish(&number);
  if (decimal_err != DecimalError::kNone) {
    FailDecimal(decimal_err, c);
    error_.column = word_column_;
    return false;
  }

  if (!EnsureProgramStarted(c, builder)) return false;

  E err = E();
  bool success = false;
  switch (word_kind_) {
  case WORD_SEQUENCE:
    success = builder->sequence_number(address_ == ':', number, &err);
    break;
  case WORD_G: success = builder->g_code(number, &err); break;
  case WORD_M: success = builder->m_code(number, &err); break;
  case WORD_DATA:
    success = builder->data(address_, has_index_ ? &index_ : nullptr,
                            number, &err);
    break;
  }
  if (!success) return FailBuilder(err, c);

  state_ = STATE_BETWEEN_WORDS;
  return true;
}

template <typename S, typename E, typename Traits>
bool BlockParser<S, E, Traits>::EndBlock(char c, Builder *builder) {
  if (checksum_seen_ && config_.verify_checksum
      && declared_checksum_ != computed_checksum_) {
    return Fail(BlockErrorKind::kChecksum, c);
  }
  if (block_has_content_) {
    if (!EnsureProgramStarted(c, builder)) return false;
    E err = E();
    if (!builder->end_block(&err)) return FailBuilder(err, c);
  }
  ResetBlock();
  return true;
}

template <typename S, typename E, typename Traits>
bool BlockParser<S, E, Traits>::EnsureProgramStarted(char c,
                                                     Builder *builder) {
  if (program_started_) return true;
  E err = E();
  if (!builder->program_start(&err)) return FailBuilder(err, c);
  program_started_ = true;
  return true;
}

}  // namespace fixg

#endif  // _FIXG_BLOCK_PARSER_H
