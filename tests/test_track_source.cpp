#include <catch2/catch.hpp>
#include "test_helpers.h"
#include "../server/source/jsonl/jsonl_track_source.h"

TEST_CASE("Tracker lines parse into vehicle observations", "[source]")
{
    JsonLinesTrackSource source;
    TrackFrame frame;

    REQUIRE(source.parseLine(
        "{\"ts\": 12.5, \"objects\": [{\"id\": 1, \"label\": \"car\", \"bbox\": [0, 0, 20, 10]}]}", frame));
    REQUIRE(frame.has_timestamp);
    REQUIRE(frame.timestamp == Approx(12.5));
    REQUIRE(frame.objects.size() == 1);
    REQUIRE(frame.objects[0].object_id == 1);
    REQUIRE(frame.objects[0].label == "car");
    REQUIRE(frame.objects[0].center.x == Approx(10.0));
    REQUIRE(frame.objects[0].center.y == Approx(5.0));

    REQUIRE(source.parseLine("{\"objects\": []}", frame));
    REQUIRE_FALSE(frame.has_timestamp);
    REQUIRE(frame.objects.empty());
}

TEST_CASE("Malformed tracker lines are rejected", "[source]")
{
    JsonLinesTrackSource source;
    TrackFrame frame;

    REQUIRE_FALSE(source.parseLine("not json", frame));
    REQUIRE_FALSE(source.parseLine("{\"ts\": 1.0}", frame));
    REQUIRE_FALSE(source.parseLine("{\"objects\": {}}", frame));
    REQUIRE_FALSE(source.parseLine("{\"ts\": \"noon\", \"objects\": []}", frame));
}

TEST_CASE("Invalid objects are dropped without rejecting the frame", "[source]")
{
    JsonLinesTrackSource source;
    TrackFrame frame;

    REQUIRE(source.parseLine(
        "{\"objects\": ["
        "{\"id\": 1, \"label\": \"person\", \"bbox\": [0, 0, 1, 1]},"
        "{\"id\": 2, \"label\": \"car\", \"bbox\": [0, 0, 1]},"
        "{\"id\": \"x\", \"label\": \"car\", \"bbox\": [0, 0, 1, 1]},"
        "{\"id\": 4, \"label\": \"bus\", \"bbox\": [0, 0, \"a\", 1]},"
        "{\"id\": 5, \"label\": \"motorbike\", \"bbox\": [4, 4, 0, 0]}"
        "]}", frame));

    REQUIRE(frame.objects.size() == 1);
    REQUIRE(frame.objects[0].object_id == 5);
    REQUIRE(frame.objects[0].center.x == Approx(2.0));
    REQUIRE(source.getDroppedObjects() == 4);
}

TEST_CASE("Reading a file skips blank and malformed lines", "[source]")
{
    std::string path = makeTempDir() + "/tracks.jsonl";
    writeFile(path,
        "{\"ts\": 1.0, \"objects\": []}\n"
        "\n"
        "garbage\n"
        "{\"ts\": 2.0, \"objects\": [{\"id\": 3, \"label\": \"truck\", \"bbox\": [0, 0, 10, 10]}]}\n");

    JsonLinesTrackSource source;
    REQUIRE_FALSE(source.isOpen());
    REQUIRE(source.initialize(path));
    REQUIRE(source.isOpen());

    TrackFrame frame;
    REQUIRE(source.next(frame));
    REQUIRE(frame.line_no == 1);
    REQUIRE(frame.timestamp == Approx(1.0));

    REQUIRE(source.next(frame));
    REQUIRE(frame.line_no == 4);
    REQUIRE(frame.objects.size() == 1);

    REQUIRE_FALSE(source.next(frame));
    REQUIRE(source.getSkippedLines() == 1);

    source.close();
    REQUIRE_FALSE(source.isOpen());
    REQUIRE_FALSE(source.initialize(path + ".missing"));
}
