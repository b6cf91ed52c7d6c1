#include <ddrsync/core/Error.hpp>

#include <doctest/doctest.h>

#include <string>
#include <vector>

using namespace DS;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::UnknownError); i <= static_cast<int>(Error::Code::IoFailure); ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::NotConfigured, "no token"};
        CHECK(describeError(withMsg) == "not_configured:no token");

        CHECK(errorCodeToString(Error::Code::FieldNotResolved) == "field_not_resolved");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }
}
