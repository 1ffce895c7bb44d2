#include <cassert>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#include "cpan/crypto.hpp"
#include "cpan/encoding/base64.hpp"
#include "cpan/error_codes.hpp"
#include "cpan/private_file.hpp"
#include "cpan/remote_api.hpp"
#include "cpan/version.hpp"

using namespace cpan;

void run_client_config_tests();
void run_client_auth_tests();
void run_client_planning_tests();
void run_client_executor_tests();
void run_client_session_tests();
void run_drive_component_tests();

namespace
{

    void test_error_code_names()
    {
        assert(to_string(ErrorCode::AuthExpired) == "auth_expired");
        assert(to_string(ErrorCode::PlanInvalid) == "plan_invalid");
        assert(to_string(ErrorCode::Cancelled) == "cancelled");
        assert(error_code_from_int(to_int(ErrorCode::Transient)) == ErrorCode::Transient);
        assert(error_code_from_int(999) == ErrorCode::InternalError);

        assert(is_retryable(ErrorCode::Transient));
        assert(!is_retryable(ErrorCode::AuthExpired));
        assert(!is_retryable(ErrorCode::NotFound));
        assert(!is_retryable(ErrorCode::PermissionDenied));
        assert(!is_retryable(ErrorCode::Cancelled));
    }

    void test_exception_classification()
    {
        const Error original(ErrorCode::NotFound, "gone");
        const auto passed = classify_exception(original);
        assert(passed.code() == ErrorCode::NotFound);
        assert(std::string(passed.what()) == "gone");

        const std::filesystem::filesystem_error missing(
            "open", std::make_error_code(std::errc::no_such_file_or_directory));
        assert(classify_exception(missing).code() == ErrorCode::NotFound);

        const std::filesystem::filesystem_error denied("open", std::make_error_code(std::errc::permission_denied));
        assert(classify_exception(denied).code() == ErrorCode::PermissionDenied);

        const std::filesystem::filesystem_error full("write", std::make_error_code(std::errc::no_space_on_device));
        assert(classify_exception(full).code() == ErrorCode::IoError);

        const std::system_error timeout(std::make_error_code(std::errc::timed_out));
        assert(classify_exception(timeout).code() == ErrorCode::Transient);

        const std::logic_error bug("unexpected");
        assert(classify_exception(bug).code() == ErrorCode::InternalError);
    }

    void test_crypto()
    {
        // RFC 7636 appendix B.
        assert(crypto::code_challenge("dBjftJeZ4CVP-mB92K27uhbUJU1p1r_wW1gFWFOEjXk") ==
               "E9Melhoa2OwvFrEMTJguCHaoeK1t8URWbuGJSstw-cM");

        const auto verifier = crypto::make_code_verifier();
        assert(verifier.size() == 43);
        assert(verifier.find('=') == std::string::npos);
        assert(verifier != crypto::make_code_verifier());

        const auto digits = crypto::random_digits(19);
        assert(digits.size() == 19);
        assert(digits.front() != '0');
        assert(digits.find_first_not_of("0123456789") == std::string::npos);

        assert(crypto::random_token(16).size() == 32);

        const std::vector<std::byte> payload = {std::byte{0xCA}, std::byte{0xFE}, std::byte{0x00}, std::byte{0x01}};
        const auto file_path = std::filesystem::temp_directory_path() / "cpan_crypto_test.bin";
        {
            std::ofstream file(file_path, std::ios::binary);
            file.write("\xCA\xFE\x00\x01", 4);
        }
        assert(crypto::hash_file(file_path) == crypto::hash_bytes(payload));
        assert(crypto::hash_text("abc") != crypto::hash_text("abd"));
        std::filesystem::remove(file_path);
    }

    void test_file_hash_spans_read_chunks()
    {
        const auto file_path = std::filesystem::temp_directory_path() / "cpan_crypto_large.bin";
        std::string content(200 * 1024 + 7, '\0');
        for (std::size_t i = 0; i < content.size(); ++i)
        {
            content[i] = static_cast<char>(i % 251);
        }
        {
            std::ofstream file(file_path, std::ios::binary | std::ios::trunc);
            file.write(content.data(), static_cast<std::streamsize>(content.size()));
        }
        assert(crypto::hash_file(file_path) == crypto::hash_text(content));
        std::filesystem::remove(file_path);

        bool threw = false;
        try
        {
            crypto::hash_file(file_path);
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    void test_private_file_write()
    {
        namespace fs = std::filesystem;
        const auto root = fs::temp_directory_path() / "cpan_private_file";
        std::error_code ec;
        fs::remove_all(root, ec);
        fs::create_directories(root);
        const auto path = root / "secret.json";
        const auto group_or_other = fs::perms::group_all | fs::perms::others_all;

        // A stale, world-readable temporary and target are both replaced.
        {
            std::ofstream stale(root / "secret.json.tmp");
            stale << "stale";
            std::ofstream old(path);
            old << "old";
        }
        fs::permissions(root / "secret.json.tmp", fs::perms::all, fs::perm_options::replace);
        fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::others_read,
                        fs::perm_options::replace);

        write_private_file(path, "{\"token\": \"t\"}");
        assert((fs::status(path).permissions() & group_or_other) == fs::perms::none);
        assert(!fs::exists(root / "secret.json.tmp"));
        std::ifstream in(path);
        const std::string written((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
        assert(written == "{\"token\": \"t\"}");

        // A directory in the way makes the final rename fail.
        fs::create_directories(root / "blocked" / "inner");
        bool threw = false;
        try
        {
            write_private_file(root / "blocked", "x");
        }
        catch (const fs::filesystem_error &)
        {
            threw = true;
        }
        assert(threw);
        fs::remove_all(root, ec);
    }

    void test_base64url()
    {
        const std::vector<std::byte> bytes = {std::byte{0xFB}, std::byte{0xFF}, std::byte{0xBF}};
        assert(encoding::encode_base64url(bytes) == "-_-_");

        const std::vector<std::byte> short_bytes = {std::byte{'h'}, std::byte{'i'}};
        assert(encoding::encode_base64url(short_bytes) == "aGk");
        assert(encoding::encode_base64url({}).empty());
    }

    void test_remote_object_model()
    {
        const auto root = root_object();
        assert(root.id == kRootObjectId);
        assert(root.is_directory());
        assert(root.path == std::string("/"));

        assert(to_string(ObjectKind::File) == "file");
        assert(object_kind_from_string("directory") == ObjectKind::Directory);
        assert(!object_kind_from_string("folder"));
    }

    void test_version()
    {
        assert(!version().empty());
    }

} // namespace

int main()
{
    try
    {
        test_error_code_names();
        test_exception_classification();
        test_crypto();
        test_file_hash_spans_read_chunks();
        test_private_file_write();
        test_base64url();
        test_remote_object_model();
        test_version();
        run_client_config_tests();
        run_client_auth_tests();
        run_client_planning_tests();
        run_client_executor_tests();
        run_client_session_tests();
        run_drive_component_tests();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Test failure: " << ex.what() << '\n';
        return 1;
    }
    std::cout << "All tests passed" << std::endl;
    return 0;
}
