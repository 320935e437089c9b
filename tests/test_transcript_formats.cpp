#include <catch2/catch_test_macros.hpp>

#include <QDir>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QTemporaryDir>

#include "ScribeError.h"
#include "TranscriptFormats.h"
#include "TestUtils.h"

namespace {

const segments_t segments{
    {0, 2500, " Hello world."},
    {2500, 61'234, " This is\ta test. "},
};

} // anon ns

TEST_CASE("Timestamps", "[formats]") {
    CHECK(transcript::srtTimestamp(0) == "00:00:00,000");
    CHECK(transcript::srtTimestamp(61'234) == "00:01:01,234");
    CHECK(transcript::srtTimestamp(3'723'004) == "01:02:03,004");
    CHECK(transcript::srtTimestamp(-5) == "00:00:00,000");

    CHECK(transcript::vttTimestamp(61'234) == "01:01.234");
    CHECK(transcript::vttTimestamp(3'723'004) == "01:02:03.004");
}

TEST_CASE("Plain text", "[formats]") {
    CHECK(transcript::toText(segments) == "Hello world.\nThis is\ta test.\n");
    CHECK(transcript::toText({}).isEmpty());
}

TEST_CASE("SubRip", "[formats]") {
    CHECK(transcript::toSrt(segments) ==
          "1\n00:00:00,000 --> 00:00:02,500\nHello world.\n\n"
          "2\n00:00:02,500 --> 00:01:01,234\nThis is\ta test.\n\n");
}

TEST_CASE("WebVTT", "[formats]") {
    CHECK(transcript::toVtt(segments) ==
          "WEBVTT\n\n"
          "00:00.000 --> 00:02.500\nHello world.\n\n"
          "00:02.500 --> 01:01.234\nThis is\ta test.\n\n");
    CHECK(transcript::toVtt({}) == "WEBVTT\n\n");
}

TEST_CASE("Tab separated", "[formats]") {
    CHECK(transcript::toTsv(segments) ==
          "start\tend\ttext\n"
          "0\t2500\tHello world.\n"
          "2500\t61234\tThis is a test.\n");
}

TEST_CASE("JSON", "[formats]") {
    const auto json = transcript::toJson(segments, "en");
    QJsonParseError err;
    const auto doc = QJsonDocument::fromJson(json.toUtf8(), &err);
    REQUIRE(err.error == QJsonParseError::NoError);

    const auto root = doc.object();
    CHECK(root["language"].toString() == "en");
    CHECK(root["text"].toString() == "Hello world. This is\ta test.");

    const auto segs = root["segments"].toArray();
    REQUIRE(segs.size() == 2);
    CHECK(segs[1].toObject()["start"].toInteger() == 2500);
    CHECK(segs[1].toObject()["end"].toInteger() == 61234);
    CHECK(segs[1].toObject()["text"].toString() == "This is\ta test.");
}

TEST_CASE("Write all sidecar files", "[formats]") {
    QTemporaryDir dir;
    REQUIRE(dir.isValid());

    SECTION("All formats, in order") {
        const auto files = transcript::writeAll(dir.path(), "talk", segments, "en");
        REQUIRE(files.size() == 5);

        const QStringList expected{"txt", "srt", "vtt", "tsv", "json"};
        for (qsizetype i = 0; i < files.size(); ++i) {
            CHECK(files[i] == QDir{dir.path()}.filePath("talk." + expected[i]));
            CHECK(QFile::exists(files[i]));
        }

        CHECK(QString::fromUtf8(test::readFile(files[0])) == transcript::toText(segments));
    }

    SECTION("Failure leaves nothing behind") {
        // Occupy the .vtt name with a directory so the third write fails
        REQUIRE(QDir{dir.path()}.mkdir("talk.vtt"));
        CHECK_THROWS_AS(transcript::writeAll(dir.path(), "talk", segments, "en"), qvs::ScribeError);
        CHECK_FALSE(QFile::exists(dir.filePath("talk.txt")));
        CHECK_FALSE(QFile::exists(dir.filePath("talk.srt")));
        CHECK_FALSE(QFile::exists(dir.filePath("talk.tsv")));
    }
}
