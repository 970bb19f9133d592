#include <livetree/core/Error.hpp>

#include <doctest/doctest.h>

#include <vector>

using namespace LT;

TEST_SUITE("core.error") {
    TEST_CASE("Error string helpers") {
        // Runtime loop so every case of the switch is taken.
        std::vector<Error::Code> codes;
        for (int i = static_cast<int>(Error::Code::InvalidError);
             i <= static_cast<int>(Error::Code::NotSupported);
             ++i) {
            codes.push_back(static_cast<Error::Code>(i));
        }

        for (auto code : codes) {
            auto label = errorCodeToString(code);
            CHECK_FALSE(label.empty());
            Error e{code, {}};
            CHECK(describeError(e) == std::string{label});
        }

        Error withMsg{Error::Code::InvalidHierarchy, "node contains its parent"};
        CHECK(describeError(withMsg) == "invalid_hierarchy:node contains its parent");

        Error withoutMsg{Error::Code::NotFound, {}};
        CHECK(describeError(withoutMsg) == "not_found");

        auto unknownLabel = errorCodeToString(static_cast<Error::Code>(999));
        CHECK(unknownLabel == "unknown_error");
    }

    TEST_CASE("expect_ok passes success through and raises ContractViolation on failure") {
        Expected<void> ok{};
        CHECK_NOTHROW(expect_ok(ok, "ctx"));

        Expected<void> failed = std::unexpected(Error{Error::Code::NotSupported, "checked on <div>"});
        try {
            expect_ok(failed, "Render::checked");
            FAIL("expect_ok did not throw");
        } catch (ContractViolation const& violation) {
            CHECK(std::string{violation.what()} == "Render::checked: not_supported:checked on <div>");
        }
    }

    TEST_CASE("contract_violation is a logic_error") {
        CHECK_THROWS_AS(contract_violation("slot mismatch"), std::logic_error);
        CHECK_THROWS_WITH_AS(contract_violation("slot mismatch"), "slot mismatch", ContractViolation);
    }
}
