// This file is part of HarmonicGrid under MIT License

#include <cstdint> // uint64_t
#include <string> // std::string
#include <cstring> // std::strrchr
#include <cstdio> // std::printf, ::snprintf
#include <cassert> // assert
#include <map> // std::map
#include <utility> // std::pair<T1, T2>, ::make_pair

#include "recorded_warnings.hxx" // MaxMessageLength

namespace recorded_warnings {

  // djb2 string hash
  inline uint64_t simple_string_hash(char const *string) {
      uint64_t hash{5381};
      for (char const *c = string; *c != 0; ++c) {
         hash = hash*33 + uint64_t(*c);
      } // c
      return hash;
  } // simple_string_hash

  inline uint64_t combined_hash(char const *file, int const line) {
      int const LineBits = 14; // the source line lives in the lowest 14 bits
      return (simple_string_hash(file) << LineBits) | (line & ((1ul << LineBits) - 1));
  } // combined_hash

  class WarningRecord {
  public:

      WarningRecord(char const *file, int const line, char const *func=nullptr)
        : message_(MaxMessageLength, '\0')
        , source_file_name_(file)
        , function_name_(func ? func : "")
        , times_overwritten_(0)
        , times_printed_(0)
        , source_file_line_(line)
      {} // constructor

      char* get_message() { ++times_overwritten_; return &message_[0]; }
      char const* message() const { return message_.c_str(); }
      char const* sourcefile() const { return source_file_name_.c_str(); }
      char const* functionname() const { return function_name_.c_str(); }
      int sourceline() const { return source_file_line_; }
      size_t times() const { return times_overwritten_; }
      int times_printed() const { return times_printed_; }
      void increment_times_printed() { ++times_printed_; }

  private:
      std::string message_; // fixed capacity of MaxMessageLength chars
      std::string source_file_name_;
      std::string function_name_;
      uint64_t    times_overwritten_;
      uint32_t    times_printed_;
      uint32_t    source_file_line_;
  }; // class WarningRecord

  char constexpr Show = 's', Clear = 'c', Count = 'n';

  std::map<uint64_t, WarningRecord> & _records() {
      static std::map<uint64_t, WarningRecord> map_; // not thread-safe, warnings are issued outside of parallel regions
      return map_;
  } // _records

  size_t _manage_records(char const what, int const echo) {
      auto & map_ = _records();
      auto const nw = map_.size();
      if (Show == what) {
          if (echo > 0) {
              if ((echo < 3) || (nw < 1)) {
                  std::printf("# %ld warnings have been recorded.\n", nw);
              } else {
                  std::printf("\n#\n# recorded %ld different warnings:\n", nw);
                  size_t total_count{0};
                  for (auto const & hw : map_) {
                      auto const & w = hw.second;
                      std::printf("# \tin %s:%d %s (%ld times)\n# \t\t%s\n", w.sourcefile(),
                          w.sourceline(), w.functionname(), w.times(), w.message());
                      total_count += w.times();
                  } // hw
                  std::printf("# %ld warnings in total\n", total_count);
              } // summary
          } // echo
      } else
      if (Clear == what) {
          if (echo > 1) std::printf("# clear all %ld warnings from records\n", nw);
          map_.clear();
      } // what
      return nw;
  } // _manage_records

  std::pair<char*,int> _new_warning(char const *file, int const line, char const *func) {
      assert(line > 0 && "line numbers created by the preprocessor start from 1");
      auto const short_file = after_last_slash(file);
      auto const hash = combined_hash(short_file, line);

      auto & map_ = _records();
      auto search = map_.find(hash);
      if (map_.end() == search) {
          search = map_.insert(std::make_pair(hash, WarningRecord(short_file, line, func))).first;
      } // not found
      auto & w = search->second;

      int constexpr MaxWarningsToErr = 1; // show max 1 warning in stderr, negative means all
      int constexpr MaxWarningsToLog = 3; // show max 3 warnings in stdout

      int flags{0};
      int const times_printed = w.times_printed();
      if (times_printed < MaxWarningsToLog) {
          flags |= 0x1; // message to stdout
          if (times_printed == MaxWarningsToLog - 1) flags |= 0x4; // announce muting
      } // print to stdout
      if ((MaxWarningsToErr < 0) || (times_printed < MaxWarningsToErr)) flags |= 0x2; // message to stderr
      if (flags) w.increment_times_printed();

      return std::make_pair(w.get_message(), flags);
  } // _new_warning

  status_t show_warnings(int const echo) {
      _manage_records(Show, echo);
      return 0;
  } // show_warnings

  size_t number_of_warnings() { return _manage_records(Count, 0); }

  status_t clear_warnings(int const echo) {
      _manage_records(Clear, echo);
      return 0;
  } // clear_warnings


#ifdef  NO_UNIT_TESTS
  status_t all_tests(int const echo) { return STATUS_TEST_NOT_INCLUDED; }
#else // NO_UNIT_TESTS

  status_t test_record_message(int const echo=9) {
      if (echo > 1) std::printf("\n# %s:%d  %s\n\n", __FILE__, __LINE__, __func__);
      WarningRecord wr(__FILE__, __LINE__, __func__);
      auto const nchars = std::snprintf(wr.get_message(), MaxMessageLength,
            "sampling= %d must be 1 (N by N) or 2 (N by 2N)", 3);
      return (nchars >= MaxMessageLength) + (1 != wr.times());
  } // test_record_message

  status_t test_preprocessor_macro(int const echo=9) {
      if (echo > 1) std::printf("\n# %s:%d  %s\n", __FILE__, __LINE__, __func__);
      auto const n_before = number_of_warnings();
      auto const nchars = warn("normalization= %d is not in [1, 4], test warning from %s", 5, __func__);
      return (nchars < 30) + (n_before + 1 != number_of_warnings());
  } // test_preprocessor_macro

  status_t test_muting(int const echo=9) {
      if (echo > 1) std::printf("\n# %s:%d  %s\n", __FILE__, __LINE__, __func__);
      int nchars{0};
      for (int iring = 0; iring < 9; ++iring) {
          nchars = warn("test warning from inside a ring loop, ring #%d", iring);
      } // iring
      return nchars; // 0 if the warning was muted before the 9th iteration
  } // test_muting

  status_t all_tests(int const echo) {
      status_t stat(0);
      stat += test_record_message(echo);
      stat += test_preprocessor_macro(echo);
      stat += test_muting(echo);
      stat += show_warnings(echo);
      stat += clear_warnings(echo); // test warnings should not show up in the final summary
      return stat;
  } // all_tests

#endif // NO_UNIT_TESTS

} // namespace recorded_warnings
