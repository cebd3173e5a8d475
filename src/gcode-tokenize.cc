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

// Streams a G-code file through the BlockParser and prints every callback,
// one per line. Useful to see how the parser understands a file, or to check
// a file for syntax errors.

#include <errno.h>
#include <fcntl.h>
#include <getopt.h>
#include <stdint.h>
#include <stdio.h>
#include <string.h>
#include <sys/time.h>
#include <unistd.h>

#include "common/logging.h"
#include "common/string-util.h"
#include "config-parser.h"
#include "gcode-parser/block-parser.h"
#include "gcode-parser/decimal.h"
#include "tokenize-config.h"

using fixg::BlockBuilder;
using fixg::BlockParser;
using fixg::Decimal;
using fixg::Mul10Strategy;
using fixg::SignificandTraits;

namespace {
struct TokenizeStats {
  int programs = 0;
  int blocks = 0;
  int words = 0;
  int errors = 0;
};

// Prints callbacks to "out" (if non-NULL) and counts them.
template <typename S>
class PrintingBuilder : public BlockBuilder<S, int> {
public:
  PrintingBuilder(FILE *out, TokenizeStats *stats)
    : out_(out), stats_(stats) {}

  bool program_start(int *) final {
    stats_->programs++;
    Print("program_start\n");
    return true;
  }

  bool sequence_number(bool alignment, Decimal<S> number, int *) final {
    stats_->words++;
    PrintWord(alignment ? ":" : "N", number);
    return true;
  }

  bool g_code(Decimal<S> number, int *) final {
    stats_->words++;
    PrintWord("G", number);
    return true;
  }

  bool m_code(Decimal<S> number, int *) final {
    stats_->words++;
    PrintWord("M", number);
    return true;
  }

  bool data(char address, const S *index, Decimal<S> number, int *) final {
    stats_->words++;
    char name[32];
    if (index) {
      snprintf(name, sizeof(name), "%c[%lld]", address, (long long)*index);
    } else {
      snprintf(name, sizeof(name), "%c", address);
    }
    PrintWord(name, number);
    return true;
  }

  bool end_block(int *) final {
    stats_->blocks++;
    Print("end_block\n");
    return true;
  }

  bool block_delete(int *) final {
    Print("block_delete\n");
    return true;
  }

private:
  void Print(const char *text) {
    if (out_) fputs(text, out_);
  }

  void PrintWord(const char *name, const Decimal<S> &number) {
    if (!out_) return;
    char value[48];
    fixg::FormatDecimal(number, value, sizeof(value));
    fprintf(out_, "%s %s\n", name, value);
  }

  FILE *const out_;
  TokenizeStats *const stats_;
};

template <typename S, Mul10Strategy M>
class Tokenizer {
public:
  typedef BlockParser<S, int, SignificandTraits<S, M>> Parser;

  Tokenizer(const TokenizeConfig &config, FILE *out)
    : keep_going_(config.keep_going), parser_(config.parser),
      builder_(out, &stats_) {}

  // Feeds everything from "fd" until EOF. Returns false if reading failed
  // or if a parse error stopped us.
  bool ProcessStream(int fd) {
    char buffer[4096];
    ssize_t r;
    while ((r = read(fd, buffer, sizeof(buffer))) != 0) {
      if (r < 0) {
        if (errno == EINTR) continue;
        Log_error("Reading input: %s", strerror(errno));
        return false;
      }
      for (ssize_t i = 0; i < r; ++i) {
        if (!parser_.Feed(buffer[i], &builder_) && !HandleError()) {
          return false;
        }
      }
    }
    if (!parser_.Finish(&builder_) && !HandleError()) return false;
    return true;
  }

  const TokenizeStats &stats() const { return stats_; }

private:
  // Report error. Returns true if we should continue.
  bool HandleError() {
    stats_.errors++;
    char msg[256];
    fixg::FormatBlockError(parser_.error(), msg, sizeof(msg));
    Log_error("%s", msg);
    if (!keep_going_) return false;
    parser_.SkipBlock();
    return true;
  }

  const bool keep_going_;
  TokenizeStats stats_;
  Parser parser_;
  PrintingBuilder<S> builder_;
};

template <typename S, Mul10Strategy M>
bool Tokenize(const TokenizeConfig &config, int fd, FILE *out) {
  struct timeval start, end;
  gettimeofday(&start, NULL);
  Tokenizer<S, M> tokenizer(config, out);
  const bool stream_ok = tokenizer.ProcessStream(fd);
  gettimeofday(&end, NULL);
  const TokenizeStats &stats = tokenizer.stats();
  const double duration = (end.tv_sec - start.tv_sec)
    + (end.tv_usec - start.tv_usec) / 1e6;
  Log_info("%d program(s), %d blocks, %d words, %d errors in %.3fs",
           stats.programs, stats.blocks, stats.words, stats.errors,
           duration);
  return stream_ok && stats.errors == 0;
}

template <typename S>
bool TokenizeWithStrategy(const TokenizeConfig &config, int fd, FILE *out) {
  if (config.shift_add)
    return Tokenize<S, Mul10Strategy::kShiftAdd>(config, fd, out);
  else
    return Tokenize<S, Mul10Strategy::kMultiply>(config, fd, out);
}
}  // namespace

static int usage(const char *progname, bool description = false) {
  if (description) {
    fprintf(stderr,
            "Tokenizes G-code and prints one line for each word and block\n"
            "the parser recognizes.\n\n");
  }
  fprintf(stderr, "Usage: %s [options] [<gcode-file>]\n"
          "Reads stdin if no file is given.\n"
          "Options:\n"
          "\t-c <config>       : Configuration file.\n"
          "\t-b <bits>         : Significand bits: 16, 32 or 64 (default 32).\n"
          "\t-S                : Use shift-add multiplication strategy.\n"
          "\t-k                : Keep going: skip blocks with errors.\n"
          "\t-q                : Quiet: only print summary.\n"
          "\t-l <logfile>      : Log to file; '-' is stderr (default).\n"
          "\t-v                : Verbose: also log debug messages.\n",
          progname);
  return 1;
}

int main(int argc, char *argv[]) {
  const char *config_file = NULL;
  const char *logfile = NULL;
  int significand_bits = -1;
  bool shift_add = false;
  bool keep_going = false;
  bool quiet = false;

  int opt;
  while ((opt = getopt(argc, argv, "b:c:hkl:qSv")) != -1) {
    switch (opt) {
    case 'b': {
      int32_t bits;
      if (!ParseFullInt32(optarg, &bits)
          || (bits != 16 && bits != 32 && bits != 64)) {
        fprintf(stderr, "-b: expected 16, 32 or 64\n");
        return usage(argv[0]);
      }
      significand_bits = bits;
      break;
    }
    case 'c':
      config_file = optarg;
      break;
    case 'k':
      keep_going = true;
      break;
    case 'l':
      logfile = optarg;
      break;
    case 'q':
      quiet = true;
      break;
    case 'S':
      shift_add = true;
      break;
    case 'v':
      Log_enable_debug(true);
      break;
    case 'h':
      return usage(argv[0], true);
    default:
      return usage(argv[0]);
    }
  }

  if (optind + 1 < argc)
    return usage(argv[0], true);

  if (logfile) Log_init(logfile);

  TokenizeConfig config;
  if (config_file) {
    ConfigParser config_parser;
    if (!config_parser.SetContentFromFile(config_file)) {
      Log_error("Cannot read config file '%s'", config_file);
      return 2;
    }
    if (!config.ConfigureFromFile(&config_parser)) {
      Log_error("Exiting. Parse error in configuration file '%s'",
                config_file);
      return 2;
    }
  }

  // Command line wins over config file.
  if (significand_bits > 0) config.significand_bits = significand_bits;
  if (shift_add) config.shift_add = true;
  if (keep_going) config.keep_going = true;

  int fd = STDIN_FILENO;
  const char *filename = "<stdin>";
  if (optind < argc) {
    filename = argv[optind];
    fd = open(filename, O_RDONLY);
    if (fd < 0) {
      Log_error("Cannot open %s: %s", filename, strerror(errno));
      return 2;
    }
  }
  Log_debug("Tokenizing %s", filename);

  FILE *const out = quiet ? NULL : stdout;
  bool success = false;
  switch (config.significand_bits) {
  case 16: success = TokenizeWithStrategy<int16_t>(config, fd, out); break;
  case 32: success = TokenizeWithStrategy<int32_t>(config, fd, out); break;
  case 64: success = TokenizeWithStrategy<int64_t>(config, fd, out); break;
  }
  if (out) fflush(out);
  if (fd != STDIN_FILENO) close(fd);
  return success ? 0 : 3;
}
