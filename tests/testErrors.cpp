#include <catch2/catch_test_macros.hpp>

#include <exceptions/errors.hpp>
#include <exceptions/exceptions.h>
#include <filesystem>
#include <stdexcept>

using namespace lynx;

TEST_CASE("Errors reaching main", "[ERRORS]") {
  SECTION("lynx errors") {
    REQUIRE(crash::exit_code(std::make_exception_ptr(TransportError("Unable to connect"))) == EXIT_FAILURE);
    REQUIRE(crash::exit_code(std::make_exception_ptr(WrongPinError("Wrong PIN, try again"))) == EXIT_FAILURE);
  }

  SECTION("Library errors are not crashes") {
    REQUIRE(crash::exit_code(std::make_exception_ptr(std::runtime_error("PEM_write_bio_PrivateKey failed"))) ==
            EXIT_FAILURE);
    auto fs_error = std::filesystem::filesystem_error("create_directories",
                                                      std::make_error_code(std::errc::permission_denied));
    REQUIRE(crash::exit_code(std::make_exception_ptr(fs_error)) == EXIT_FAILURE);
  }
}

TEST_CASE("Error hierarchy", "[ERRORS]") {
  REQUIRE_THROWS_AS(throw NotPairedError("Not paired"), StateError);
  REQUIRE_THROWS_AS(throw AlreadyActiveError("Already streaming"), StateError);
  REQUIRE_THROWS_AS(throw AuthenticationError("Certificate mismatch"), Error);
  REQUIRE_THROWS_AS(throw CapabilityError("No HDR"), std::runtime_error);
}
