#define BOOST_TEST_DYN_LINK
#include <boost/test/unit_test.hpp>

#include <system.hh>

#include "global.h"

using namespace timeshift;

namespace {
  strings_list make_args(const char * const * argv) {
    strings_list args;
    for (; *argv; argv++)
      args.push_back(*argv);
    return args;
  }

  bool contains(const string& haystack, const string& needle) {
    return haystack.find(needle) != string::npos;
  }
}

struct global_fixture {
  global_scope_t     session;
  std::ostringstream out;
  std::ostringstream err;
  std::streambuf *   cerr_buf;
  std::vector<path>  scripts;

  global_fixture() : cerr_buf(std::cerr.rdbuf(err.rdbuf())) {
    epoch = none;
    error_context();
  }
  ~global_fixture() {
    std::cerr.rdbuf(cerr_buf);
    epoch = none;
    error_context();

    foreach (const path& script, scripts) {
      boost::system::error_code ec;
      boost::filesystem::remove(script, ec);
    }
  }

  path write_script(const string& text) {
    path script = boost::filesystem::temp_directory_path() /
      boost::filesystem::unique_path("timeshift-%%%%-%%%%-%%%%.txt");
    scripts.push_back(script);

    boost::filesystem::ofstream file(script);
    file << text;
    return script;
  }

  int run(const char * const * argv) {
    return session.execute_command_wrapper
      (session.read_command_arguments(make_args(argv)), out);
  }
};

BOOST_FIXTURE_TEST_SUITE(driver, global_fixture)

BOOST_AUTO_TEST_CASE(testReadArguments)
{
  const char * argv[] = {
    "--verbose", "--debug", "shift", "--trace", "2", "--explain",
    "Y1", "--tokens", "--", "--no-cache", "2021-01-01", NULL
  };
  strings_list args = session.read_command_arguments(make_args(argv));

  BOOST_REQUIRE_EQUAL(3U, args.size());
  BOOST_CHECK_EQUAL(string("Y1"), args.front());
  BOOST_CHECK_EQUAL(string("2021-01-01"), args.back());
  BOOST_CHECK(session.explain);
  BOOST_CHECK(session.show_tokens);
  BOOST_CHECK(session.use_cache);
  BOOST_CHECK(! session.script_file);

  const char * script_argv[] = { "--script", "~/shifts.txt", NULL };
  BOOST_CHECK(session.read_command_arguments(make_args(script_argv)).empty());
  BOOST_CHECK_EQUAL(string("~/shifts.txt"), *session.script_file);
}

BOOST_AUTO_TEST_CASE(testIllegalArguments)
{
  const char * bogus[]   = { "Y1", "--bogus", NULL };
  const char * no_now[]  = { "Y1", "--now", NULL };
  const char * bad_now[] = { "--now", "yesterday", "Y1", NULL };

  BOOST_CHECK_THROW(session.read_command_arguments(make_args(bogus)),
                    std::logic_error);
  BOOST_CHECK_THROW(session.read_command_arguments(make_args(no_now)),
                    std::logic_error);
  BOOST_CHECK_THROW(session.read_command_arguments(make_args(bad_now)),
                    datetime_error);
  BOOST_CHECK(! epoch);
}

BOOST_AUTO_TEST_CASE(testFixedNow)
{
  const char * argv[] = { "--now", "2021-01-20T08:00:00+01:00", "W^1 w1", NULL };

  BOOST_CHECK_EQUAL(0, run(argv));
  BOOST_REQUIRE(epoch);
  BOOST_CHECK_EQUAL(parse_moment("2021-01-20T08:00:00+01:00"), *epoch);
  BOOST_CHECK_EQUAL(string("2021-01-04T08:00:00+01:00\n"), out.str());
  BOOST_CHECK_EQUAL(string(""), err.str());
}

BOOST_AUTO_TEST_CASE(testSeveralTimestamps)
{
  const char * argv[] = {
    "D$1", "2000-02-13T14:55:22Z", "2100-02-13T00:00:00+03:00", NULL
  };

  BOOST_CHECK_EQUAL(0, run(argv));
  BOOST_CHECK_EQUAL(string("2000-02-29T14:55:22Z\n"
                           "2100-02-28T00:00:00+03:00\n"), out.str());
}

BOOST_AUTO_TEST_CASE(testShowTokensOption)
{
  const char * argv[] = { "--tokens", "Y+1 D$3", "2020-06-13T14:55:22Z", NULL };

  BOOST_CHECK_EQUAL(0, run(argv));
  BOOST_CHECK_EQUAL(string("--- Shift pattern tokens ---\n"
                           "TOK_CLAUSE unit=Y sign=+ digits=1 at 0: Y+1\n"
                           "TOK_CLAUSE unit=D anchor=$ digits=3 at 4: D$3\n"
                           "END_REACHED: <EOF>\n"
                           "2021-06-28T14:55:22Z\n"), out.str());
}

BOOST_AUTO_TEST_CASE(testExplainOption)
{
  const char * argv[] = { "--explain", "  D$3  h-6 ", "2021-02-10T08:00:00Z", NULL };

  BOOST_CHECK_EQUAL(0, run(argv));
  BOOST_CHECK_EQUAL(string("--- Shift \"D$3 h-6\" ---\n"
                           "day:         from end 3\n"
                           "hour:        move by -6\n"
                           "2021-02-26T02:00:00Z\n"), out.str());
}

BOOST_AUTO_TEST_CASE(testCacheOptions)
{
  const char * first[]  = { "Y+1 M+2", "2020-06-13T14:55:22Z", NULL };
  const char * second[] = { "  Y+1 M+2", "2021-06-13T14:55:22Z", NULL };

  BOOST_CHECK_EQUAL(0, run(first));
  BOOST_CHECK_EQUAL(0, run(second));
  BOOST_CHECK_EQUAL(1U, session.shift_cache().size());
  BOOST_CHECK_EQUAL(string("2021-08-13T14:55:22Z\n"
                           "2022-08-13T14:55:22Z\n"), out.str());

  global_scope_t     uncached;
  std::ostringstream uncached_out;
  const char * no_cache[] = { "--no-cache", "Y+1 M+2", "2020-06-13T14:55:22Z", NULL };

  BOOST_CHECK_EQUAL(0, uncached.execute_command_wrapper
                    (uncached.read_command_arguments(make_args(no_cache)),
                     uncached_out));
  BOOST_CHECK(! uncached.use_cache);
  BOOST_CHECK_EQUAL(0U, uncached.shift_cache().size());
  BOOST_CHECK_EQUAL(string("2021-08-13T14:55:22Z\n"), uncached_out.str());
}

BOOST_AUTO_TEST_CASE(testFailureStatus)
{
  const char * bad_pattern[] = { "M1 Y2", "2020-06-13T14:55:22Z", NULL };

  BOOST_CHECK_EQUAL(1, run(bad_pattern));
  BOOST_CHECK_EQUAL(string(""), out.str());
  BOOST_CHECK_EQUAL(string("  M1 Y2\n     ^^\n"
                           "Error: Wrong sequence of units in \"M1 Y2\" "
                           "(at \"Y2\"), expected one of \"DWwhmslun\"\n"),
                    err.str());
  BOOST_CHECK_EQUAL(0U, session.shift_cache().size());

  err.str("");
  const char * bad_time[] = { "Y+1", "yesterday", NULL };
  BOOST_CHECK_EQUAL(1, run(bad_time));
  BOOST_CHECK(contains(err.str(), "Error: Invalid date/time: yesterday"));

  err.str("");
  const char * nothing[] = { NULL };
  BOOST_CHECK_EQUAL(1, run(nothing));
  BOOST_CHECK_EQUAL(string("Error: Usage: timeshift [options] PATTERN "
                           "[TIMESTAMP...]\n"), err.str());
}

BOOST_AUTO_TEST_CASE(testScript)
{
  path script = write_script
    ("# Shifts applied to fixed moments\n"
     "\"Y+1 M+2\" 2020-06-13T14:55:22Z\n"
     "\n"
     "   # an indented comment\n"
     "'D$1' 2000-02-13T14:55:22Z 2100-02-13T00:00:00+03:00\n"
     "\"\" 2020-06-13T14:55:21+03:00\n"
     "W^1\\ w1 2021-03-20T10:00:00Z\n");

  BOOST_CHECK_EQUAL(0, session.execute_script(script, out));
  BOOST_CHECK_EQUAL(string("2021-08-13T14:55:22Z\n"
                           "2000-02-29T14:55:22Z\n"
                           "2100-02-28T00:00:00+03:00\n"
                           "2020-06-13T14:55:21+03:00\n"
                           "2021-03-01T10:00:00Z\n"), out.str());
  BOOST_CHECK_EQUAL(string(""), err.str());

  // The blank pattern is never stored
  BOOST_CHECK_EQUAL(3U, session.shift_cache().size());
}

BOOST_AUTO_TEST_CASE(testScriptStopsAtError)
{
  path script = write_script
    ("Y+1 2020-06-13T14:55:22Z\n"
     "# the next line is wrong\n"
     "\"M1 Y2\" 2020-06-13T14:55:22Z\n"
     "Y+2 2020-06-13T14:55:22Z\n");

  BOOST_CHECK_EQUAL(1, session.execute_script(script, out));
  BOOST_CHECK_EQUAL(string("2021-06-13T14:55:22Z\n"), out.str());

  string report = err.str();
  BOOST_CHECK(contains(report, "\", line 3:\n  M1 Y2\n     ^^\n"));
  BOOST_CHECK(contains(report, "Error: Wrong sequence of units in \"M1 Y2\""));
  BOOST_CHECK(! contains(report, "line 4"));
}

BOOST_AUTO_TEST_CASE(testMissingScript)
{
  path missing = boost::filesystem::temp_directory_path() /
    boost::filesystem::unique_path("timeshift-missing-%%%%-%%%%.txt");

  BOOST_CHECK_THROW(session.execute_script(missing, out), std::runtime_error);
}

BOOST_AUTO_TEST_SUITE_END()
