/**
 * @file test_lazy_metadata.cpp
 * @brief Unit tests for the four-state LazyMetadata cache
 */

#include <gtest/gtest.h>
#include <iot/entity/lazy_metadata.h>
#include <iot/entity/exceptions.h>

#include <cmath>
#include <limits>
#include <stdexcept>
#include <thread>
#include <vector>

using namespace iot::entity;

class LazyMetadataTest : public ::testing::Test {
protected:
    MetadataCodec codec_;

    static Json::Value sensorDocument() {
        Json::Value doc;
        doc["description"] = "sensor";
        doc["floor"] = 3;
        return doc;
    }

    // Object with @p levels wrapping members around a scalar leaf
    static Json::Value nested(int levels) {
        Json::Value doc(1);
        for (int i = 0; i < levels; ++i) {
            Json::Value wrapper(Json::objectValue);
            wrapper["n"] = doc;
            doc = wrapper;
        }
        return doc;
    }
};

// ============================================================================
// EMPTY
// ============================================================================

TEST_F(LazyMetadataTest, Empty_GetReturnsEmptyDocument) {
    LazyMetadata metadata(codec_);

    EXPECT_EQ(metadata.state(), MetadataState::EMPTY);
    EXPECT_EQ(metadata.get(), Json::Value(Json::objectValue));
    EXPECT_EQ(metadata.state(), MetadataState::EMPTY);
}

TEST_F(LazyMetadataTest, Empty_EncodeIsEmptyObject) {
    LazyMetadata metadata(codec_);
    EXPECT_EQ(metadata.encode(), "{}");
}

// ============================================================================
// ENCODED_ONLY -> BOTH
// ============================================================================

TEST_F(LazyMetadataTest, Load_DoesNotDecode) {
    LazyMetadata metadata(codec_);
    metadata.load("{\"description\":\"sensor\"}");

    EXPECT_EQ(metadata.state(), MetadataState::ENCODED_ONLY);
}

TEST_F(LazyMetadataTest, Get_DecodesOnceAndCaches) {
    LazyMetadata metadata(codec_);
    metadata.load("{\"description\":\"sensor\"}");

    const Json::Value& first = metadata.get();
    EXPECT_EQ(metadata.state(), MetadataState::BOTH);
    EXPECT_EQ(first["description"].asString(), "sensor");

    const Json::Value& second = metadata.get();
    EXPECT_EQ(&first, &second);
}

TEST_F(LazyMetadataTest, Load_CorruptBytesFailOnlyAtGet) {
    LazyMetadata metadata(codec_);
    EXPECT_NO_THROW(metadata.load("{corrupt"));
    EXPECT_EQ(metadata.state(), MetadataState::ENCODED_ONLY);

    EXPECT_THROW((void)metadata.get(), DecodeError);
    // Failed decode publishes nothing; the error repeats on the next call
    EXPECT_EQ(metadata.state(), MetadataState::ENCODED_ONLY);
    EXPECT_THROW((void)metadata.get(), DecodeError);
}

TEST_F(LazyMetadataTest, Load_ReplacesPreviousCache) {
    LazyMetadata metadata(codec_);
    metadata.set(sensorDocument());
    metadata.load("{\"description\":\"gateway\"}");

    EXPECT_EQ(metadata.state(), MetadataState::ENCODED_ONLY);
    EXPECT_EQ(metadata.get()["description"].asString(), "gateway");
    EXPECT_FALSE(metadata.get().isMember("floor"));
}

TEST_F(LazyMetadataTest, Load_EmptyBytesDecodeToEmptyDocument) {
    LazyMetadata metadata(codec_);
    metadata.load("");

    EXPECT_EQ(metadata.state(), MetadataState::ENCODED_ONLY);
    EXPECT_EQ(metadata.get(), Json::Value(Json::objectValue));
    EXPECT_EQ(metadata.state(), MetadataState::BOTH);
}

// ============================================================================
// PARSED_ONLY
// ============================================================================

TEST_F(LazyMetadataTest, Set_ThenGetReturnsSameDocumentWithoutDecoding) {
    LazyMetadata metadata(codec_);
    metadata.load("{corrupt");
    metadata.set(sensorDocument());

    EXPECT_EQ(metadata.state(), MetadataState::PARSED_ONLY);
    EXPECT_NO_THROW((void)metadata.get());
    EXPECT_EQ(metadata.get(), sensorDocument());
}

TEST_F(LazyMetadataTest, Set_DropsStaleBytes) {
    LazyMetadata metadata(codec_);
    metadata.load("{\"description\":\"old\"}");
    (void)metadata.get();
    ASSERT_EQ(metadata.state(), MetadataState::BOTH);

    metadata.set(sensorDocument());
    EXPECT_EQ(metadata.state(), MetadataState::PARSED_ONLY);
    EXPECT_EQ(metadata.encode(), codec_.encode(sensorDocument()));
}

TEST_F(LazyMetadataTest, Set_NullBecomesEmptyObject) {
    LazyMetadata metadata(codec_);
    metadata.set(Json::Value());

    EXPECT_EQ(metadata.state(), MetadataState::PARSED_ONLY);
    EXPECT_EQ(metadata.get(), Json::Value(Json::objectValue));
}

TEST_F(LazyMetadataTest, Set_NonObjectRejected) {
    LazyMetadata metadata(codec_);

    EXPECT_THROW(metadata.set(Json::Value(42)), std::invalid_argument);
    EXPECT_THROW(metadata.set(Json::Value(Json::arrayValue)), std::invalid_argument);
    EXPECT_EQ(metadata.state(), MetadataState::EMPTY);
}

// ============================================================================
// Only documents that can be read back are accepted
// ============================================================================

TEST_F(LazyMetadataTest, Set_DeeperThanLimitRejected) {
    LazyMetadata metadata;  // default codec, depth limit 256 unless configured
    int maxDepth = MetadataCodec::defaultCodec().options().maxDepth;

    EXPECT_THROW(metadata.set(nested(maxDepth)), std::invalid_argument);
    EXPECT_EQ(metadata.state(), MetadataState::EMPTY);
}

TEST_F(LazyMetadataTest, Set_AtDepthLimitRoundTrips) {
    MetadataCodec::Options options;
    options.maxDepth = 4;
    MetadataCodec shallow(options);

    LazyMetadata source(shallow);
    source.set(nested(3));
    EXPECT_THROW(source.set(nested(4)), std::invalid_argument);

    LazyMetadata target(shallow);
    target.load(source.encode());
    EXPECT_EQ(target.get(), nested(3));
}

TEST_F(LazyMetadataTest, Set_NonFiniteNumbersRejected) {
    LazyMetadata metadata(codec_);
    metadata.set(sensorDocument());

    Json::Value inf = sensorDocument();
    inf["x"] = std::numeric_limits<double>::infinity();
    EXPECT_THROW(metadata.set(inf), std::invalid_argument);

    Json::Value nan = sensorDocument();
    nan["samples"].append(1.5);
    nan["samples"].append(std::nan(""));
    EXPECT_THROW(metadata.set(nan), std::invalid_argument);

    EXPECT_THROW(metadata.setField("x", -std::numeric_limits<double>::infinity()),
                 std::invalid_argument);

    // The previous document is kept
    EXPECT_EQ(metadata.get(), sensorDocument());
}

TEST_F(LazyMetadataTest, Set_EncodingLargerThanLimitRejected) {
    MetadataCodec::Options options;
    options.maxBytes = 32;
    MetadataCodec small(options);

    LazyMetadata metadata(small);
    metadata.setField("description", "sensor");
    EXPECT_THROW(metadata.setField("notes", std::string(64, 'x')), std::invalid_argument);
    EXPECT_EQ(metadata.encode(), "{\"description\":\"sensor\"}");
}

// ============================================================================
// Encode never mutates
// ============================================================================

TEST_F(LazyMetadataTest, Encode_ParsedOnlyStaysParsedOnly) {
    LazyMetadata metadata(codec_);
    metadata.set(sensorDocument());

    std::string bytes = metadata.encode();
    EXPECT_EQ(bytes, "{\"description\":\"sensor\",\"floor\":3}");
    EXPECT_EQ(metadata.state(), MetadataState::PARSED_ONLY);
}

TEST_F(LazyMetadataTest, Encode_EncodedOnlyReturnsBytesUnchanged) {
    // Non-canonical spacing proves no decode/encode round trip happens
    const std::string loaded = "{ \"b\" : 1 ,  \"a\" : 2 }";
    LazyMetadata metadata(codec_);
    metadata.load(loaded);

    EXPECT_EQ(metadata.encode(), loaded);
    EXPECT_EQ(metadata.state(), MetadataState::ENCODED_ONLY);
}

TEST_F(LazyMetadataTest, Encode_LoadRoundTrip) {
    LazyMetadata source(codec_);
    source.set(sensorDocument());

    LazyMetadata target(codec_);
    target.load(source.encode());
    EXPECT_EQ(target.get(), sensorDocument());
}

// ============================================================================
// Fields
// ============================================================================

TEST_F(LazyMetadataTest, SetField_DecodesThenReplaces) {
    LazyMetadata metadata(codec_);
    metadata.load("{\"description\":\"sensor\"}");
    metadata.setField("floor", 7);

    EXPECT_EQ(metadata.state(), MetadataState::PARSED_ONLY);
    EXPECT_EQ(metadata.get()["description"].asString(), "sensor");
    EXPECT_EQ(metadata.get()["floor"].asInt(), 7);
}

TEST_F(LazyMetadataTest, SetField_OnEmpty) {
    LazyMetadata metadata(codec_);
    metadata.setField("description", "sensor");

    EXPECT_EQ(metadata.get()["description"].asString(), "sensor");
}

TEST_F(LazyMetadataTest, SetField_CorruptBytesThrowAndKeepState) {
    LazyMetadata metadata(codec_);
    metadata.load("[broken");

    EXPECT_THROW(metadata.setField("a", 1), DecodeError);
    EXPECT_EQ(metadata.state(), MetadataState::ENCODED_ONLY);
}

TEST_F(LazyMetadataTest, GetField_DefaultWhenAbsent) {
    LazyMetadata metadata(codec_);
    metadata.set(sensorDocument());

    EXPECT_EQ(metadata.getField("floor").asInt(), 3);
    EXPECT_EQ(metadata.getField("room", "none").asString(), "none");
    EXPECT_TRUE(metadata.getField("room").isNull());
}

// ============================================================================
// Copy / clear
// ============================================================================

TEST_F(LazyMetadataTest, Copy_SharesStateIndependently) {
    LazyMetadata original(codec_);
    original.set(sensorDocument());

    LazyMetadata copy(original);
    copy.setField("floor", 9);

    EXPECT_EQ(original.get()["floor"].asInt(), 3);
    EXPECT_EQ(copy.get()["floor"].asInt(), 9);
}

TEST_F(LazyMetadataTest, Clear_ReturnsToEmpty) {
    LazyMetadata metadata(codec_);
    metadata.load("{\"a\":1}");
    (void)metadata.get();

    metadata.clear();
    EXPECT_EQ(metadata.state(), MetadataState::EMPTY);
    EXPECT_TRUE(metadata.isEmpty());
}

TEST(MetadataStateTest, ToString) {
    EXPECT_EQ(metadataStateToString(MetadataState::EMPTY), "EMPTY");
    EXPECT_EQ(metadataStateToString(MetadataState::ENCODED_ONLY), "ENCODED_ONLY");
    EXPECT_EQ(metadataStateToString(MetadataState::PARSED_ONLY), "PARSED_ONLY");
    EXPECT_EQ(metadataStateToString(MetadataState::BOTH), "BOTH");
}

// ============================================================================
// Concurrent first readers
// ============================================================================

TEST_F(LazyMetadataTest, Get_ConcurrentFirstReadersSeeOnePublishedDocument) {
    LazyMetadata metadata(codec_);
    metadata.load("{\"description\":\"sensor\",\"floor\":3}");

    std::vector<const Json::Value*> seen(8, nullptr);
    std::vector<std::thread> threads;
    for (size_t i = 0; i < seen.size(); ++i) {
        threads.emplace_back([&metadata, &seen, i]() {
            seen[i] = &metadata.get();
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(metadata.state(), MetadataState::BOTH);
    for (const Json::Value* doc : seen) {
        EXPECT_EQ(doc, &metadata.get());
    }
    EXPECT_EQ(metadata.get(), sensorDocument());
}
