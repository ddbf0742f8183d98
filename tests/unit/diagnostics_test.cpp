#include <gtest/gtest.h>
#include <surl/core/diagnostics.h>
#include <sstream>
#include <string>
#include <vector>

using namespace surl::core;

TEST(Diagnostics, SeverityNames) {
    EXPECT_STREQ(severity_name(Severity::Debug), "debug");
    EXPECT_STREQ(severity_name(Severity::Error), "error");
}

TEST(Diagnostics, FormatFailureShowsCodeAndOffset) {
    DiagnosticEvent event;
    event.severity = Severity::Error;
    event.stage = "port";
    event.code = Errc::InvalidPort;
    event.offset = 19;
    event.message = "invalid port: '70000' is out of range";
    EXPECT_EQ(format_diagnostic(event),
              "[error] port InvalidPort at 19: invalid port: '70000' is out of range");
}

TEST(Diagnostics, FormatSuccessHasNoCode) {
    DiagnosticEvent event;
    event.stage = "done";
    event.message = "http://example.com/";
    EXPECT_EQ(format_diagnostic(event), "[debug] done: http://example.com/");
}

TEST(Diagnostics, ReportFailureRecordsError) {
    DiagnosticEmitter emitter;
    emitter.report_failure("host", "http://localhost/", 7,
                           make_error(Errc::InvalidHost, "'localhost' needs at least 2 labels"));

    ASSERT_EQ(emitter.size(), 1u);
    const auto& event = emitter.events()[0];
    EXPECT_EQ(event.severity, Severity::Error);
    EXPECT_EQ(event.stage, "host");
    EXPECT_EQ(event.input, "http://localhost/");
    EXPECT_EQ(event.code, Errc::InvalidHost);
    EXPECT_EQ(event.offset, 7u);
    EXPECT_EQ(event.message, "invalid host: 'localhost' needs at least 2 labels");
}

TEST(Diagnostics, ReportParsedIsDebug) {
    DiagnosticEmitter emitter;
    emitter.report_parsed("HTTP://a.b", "http://a.b/");

    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].severity, Severity::Debug);
    EXPECT_EQ(emitter.events()[0].code, std::nullopt);
    EXPECT_EQ(emitter.events()[0].message, "http://a.b/");
}

TEST(Diagnostics, MinSeverityDropsDebug) {
    DiagnosticEmitter emitter;
    emitter.set_min_severity(Severity::Error);
    EXPECT_EQ(emitter.min_severity(), Severity::Error);

    emitter.report_parsed("http://a.b/", "http://a.b/");
    emitter.report_failure("scheme", "a.b", 0, make_error(Errc::MissingScheme));
    ASSERT_EQ(emitter.size(), 1u);
    EXPECT_EQ(emitter.events()[0].code, Errc::MissingScheme);
}

TEST(Diagnostics, ObserversSeeEveryEvent) {
    DiagnosticEmitter emitter;
    std::vector<std::string> seen;
    emitter.add_observer([&seen](const DiagnosticEvent& event) { seen.push_back(event.stage); });

    emitter.report_failure("query", "http://a.b/?x", 12, make_error(Errc::InvalidQuery));
    emitter.report_parsed("http://a.b/", "http://a.b/");
    EXPECT_EQ(seen, (std::vector<std::string>{"query", "done"}));
}

TEST(Diagnostics, StreamObserverWritesLines) {
    std::ostringstream out;
    DiagnosticEmitter emitter;
    emitter.add_observer(make_stream_observer(out));

    emitter.report_failure("fragment", "http://a.b/#%2", 12, make_error(Errc::InvalidEncoding));
    EXPECT_EQ(out.str(), "[error] fragment InvalidEncoding at 12: invalid percent-encoding\n");
}
