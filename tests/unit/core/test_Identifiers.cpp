#include "core/Error.hpp"
#include "core/Identifiers.hpp"

#include <doctest/doctest.h>

#include <set>

using namespace TS;

TEST_SUITE("Identifiers") {
    TEST_CASE("generated ids are version 4 uuids") {
        std::set<std::string> seen;
        for (int i = 0; i < 64; ++i) {
            auto id = generateUuid();
            CHECK(isUuid(id));
            CHECK(id[14] == '4');
            seen.insert(id);
        }
        CHECK(seen.size() == 64);
    }

    TEST_CASE("isUuid rejects near misses") {
        CHECK_FALSE(isUuid(""));
        CHECK_FALSE(isUuid("123e4567-e89b-12d3-a456-42661417400"));
        CHECK_FALSE(isUuid("123e4567xe89b-12d3-a456-426614174000"));
        CHECK_FALSE(isUuid("123e4567-e89b-12d3-a456-42661417400g"));
        CHECK(isUuid("123e4567-e89b-12d3-a456-426614174000"));
    }

    TEST_CASE("timestamps are utc with milliseconds") {
        auto const epoch = std::chrono::system_clock::time_point{};
        CHECK(formatTimestamp(epoch) == "1970-01-01T00:00:00.000Z");
        CHECK(formatTimestamp(epoch + std::chrono::milliseconds{1500}) == "1970-01-01T00:00:01.500Z");
        CHECK(toMillis(epoch + std::chrono::seconds{2}) == 2000);
        CHECK(nowTimestamp().size() == 24);
    }
}

TEST_SUITE("Error") {
    TEST_CASE("codes map to wire strings and categories") {
        CHECK(errorCodeToString(Error::Code::InvalidWildcardUsage) == "invalid_wildcard_usage");
        CHECK(errorCodeToString(Error::Code::IntegrityError) == "integrity_error");
        CHECK(errorCategory(Error::Code::TurnGap) == Error::Category::Sequencing);
        CHECK(isDeltaLocal(Error::Code::ElementNotFound));
        CHECK(isDeltaLocal(Error::Code::MissingParent));
        CHECK_FALSE(isDeltaLocal(Error::Code::IntegrityError));
        CHECK_FALSE(isDeltaLocal(Error::Code::StaleTurn));
    }

    TEST_CASE("describeError joins code and message") {
        CHECK(describeError(Error{Error::Code::NotFound, "slot"}) == "not_found:slot");
        CHECK(describeError(Error{Error::Code::Timeout, ""}) == "timeout");
    }
}
