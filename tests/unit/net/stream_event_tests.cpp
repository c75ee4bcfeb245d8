#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest.h>

#include <QJsonObject>

#include "service/net/stream_event.h"

TEST_CASE("parseStreamEvent decodes all five event kinds")
{
    StreamEvent ev;
    REQUIRE(parseStreamEvent(R"({"type":"token","content":"Hi"})", &ev));
    CHECK(ev.kind() == StreamEvent::Kind::Token);
    REQUIRE(ev.as<TokenEvent>() != nullptr);
    CHECK(ev.as<TokenEvent>()->content == QStringLiteral("Hi"));

    REQUIRE(parseStreamEvent(R"({"type":"tool_call_start","tool_id":"c1","tool_name":"query_db","arguments":{"sql":"select 1"}})", &ev));
    CHECK(ev.kind() == StreamEvent::Kind::ToolCallStart);
    const ToolCallStartEvent *start = ev.as<ToolCallStartEvent>();
    REQUIRE(start != nullptr);
    CHECK(start->toolId == QStringLiteral("c1"));
    CHECK(start->toolName == QStringLiteral("query_db"));
    CHECK(start->arguments.toObject().value(QStringLiteral("sql")).toString() == QStringLiteral("select 1"));

    REQUIRE(parseStreamEvent(R"({"type":"tool_call_end","tool_id":"c1","result":"42 rows"})", &ev));
    CHECK(ev.kind() == StreamEvent::Kind::ToolCallEnd);
    CHECK(ev.as<ToolCallEndEvent>()->result == QStringLiteral("42 rows"));

    REQUIRE(parseStreamEvent(R"({"type":"done","content":"full answer"})", &ev));
    CHECK(ev.kind() == StreamEvent::Kind::Done);
    CHECK(ev.as<DoneEvent>()->content == QStringLiteral("full answer"));

    REQUIRE(parseStreamEvent(R"({"type":"error","message":"model unavailable"})", &ev));
    CHECK(ev.kind() == StreamEvent::Kind::Error);
    CHECK(ev.as<ErrorEvent>()->message == QStringLiteral("model unavailable"));
    CHECK(ev.as<TokenEvent>() == nullptr);
}

TEST_CASE("structured tool results are kept as compact JSON text")
{
    StreamEvent ev;
    REQUIRE(parseStreamEvent(R"({"type":"tool_call_end","tool_id":"c2","result":{"rows":3}})", &ev));
    CHECK(ev.as<ToolCallEndEvent>()->result == QStringLiteral("{\"rows\":3}"));
}

TEST_CASE("invalid frames are rejected with a reason")
{
    StreamEvent ev;
    QString error;

    CHECK_FALSE(parseStreamEvent("{\"type\":\"tok", &ev, &error));
    CHECK_FALSE(error.isEmpty());

    error.clear();
    CHECK_FALSE(parseStreamEvent("[1,2,3]", &ev, &error));
    CHECK(error.contains(QStringLiteral("object")));

    error.clear();
    CHECK_FALSE(parseStreamEvent(R"({"type":"heartbeat"})", &ev, &error));
    CHECK(error.contains(QStringLiteral("heartbeat")));

    error.clear();
    CHECK_FALSE(parseStreamEvent(R"({"content":"no type"})", &ev, &error));
    CHECK(error.contains(QStringLiteral("type")));

    error.clear();
    CHECK_FALSE(parseStreamEvent(R"({"type":"token"})", &ev, &error));
    CHECK(error.contains(QStringLiteral("content")));

    error.clear();
    CHECK_FALSE(parseStreamEvent(R"({"type":"tool_call_start","tool_id":"c1","tool_name":"x"})", &ev, &error));
    CHECK(error.contains(QStringLiteral("arguments")));

    error.clear();
    CHECK_FALSE(parseStreamEvent(R"({"type":"error","message":7})", &ev, &error));
    CHECK(error.contains(QStringLiteral("message")));
}

TEST_CASE("toJson reproduces the wire shape")
{
    const QJsonObject token = StreamEvent(TokenEvent{QStringLiteral("a")}).toJson();
    CHECK(token.value(QStringLiteral("type")).toString() == QStringLiteral("token"));
    CHECK(token.value(QStringLiteral("content")).toString() == QStringLiteral("a"));

    const QJsonObject end = StreamEvent(ToolCallEndEvent{QStringLiteral("c1"), QStringLiteral("ok")}).toJson();
    CHECK(end.value(QStringLiteral("type")).toString() == QStringLiteral("tool_call_end"));
    CHECK(end.value(QStringLiteral("tool_id")).toString() == QStringLiteral("c1"));

    CHECK(streamEventKindName(StreamEvent::Kind::ToolCallStart) == QStringLiteral("tool_call_start"));
    CHECK(StreamEvent(DoneEvent{QStringLiteral("x")}) != StreamEvent(TokenEvent{QStringLiteral("x")}));
}
