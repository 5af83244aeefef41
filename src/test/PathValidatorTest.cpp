#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>

#include "infrastructure/LocalFileSystem.hpp"
#include "infrastructure/PathValidator.hpp"
#include "test/support/TestSupport.hpp"

namespace fs = std::filesystem;
using namespace fieldtrack;
using infrastructure::PathValidator;

int main() {
    std::cout << "[Test] Starting PathValidator Test..." << std::endl;

    test::ScratchDirectory scratch("validator");
    PathValidator validator(std::make_shared<infrastructure::LocalFileSystem>());

    // Healthy directory, with surrounding whitespace tolerated.
    auto ok = validator.validate("  " + scratch.str() + "  ");
    assert(ok.valid && ok.writable && !ok.error);

    // The probe leaves nothing behind.
    assert(fs::is_empty(scratch.path()));

    // Ordered failures.
    auto empty = validator.validate("   ");
    assert(!empty.valid && !empty.writable && empty.error == std::string("Path is required"));

    auto forbidden = validator.validate(scratch.str() + "/bad|name");
    assert(!forbidden.valid && forbidden.error && forbidden.error->find("invalid character") != std::string::npos);

    auto missing = validator.validate((scratch.path() / "missing").string());
    assert(!missing.valid && missing.error == std::string("Path does not exist"));

    fs::path file = scratch.path() / "plain.txt";
    std::ofstream(file) << "x";
    auto notDir = validator.validate(file.string());
    assert(!notDir.valid && notDir.error == std::string("Path is not a directory"));

    // Write probe failures are reported, not thrown.
    auto faulty = std::make_shared<test::FaultyFileSystem>();
    faulty->denyWritesUnder(scratch.path());
    PathValidator readOnly(faulty);
    auto unwritable = readOnly.validate(scratch.str());
    assert(unwritable.valid && !unwritable.writable);
    assert(unwritable.error && unwritable.error->find("not writable") != std::string::npos);

    // Forbidden character rules follow the strictest platform, allowing drive letters.
    assert(!PathValidator::FindForbiddenPathCharacter("C:\\Users\\me\\OneDrive\\Reports"));
    assert(!PathValidator::FindForbiddenPathCharacter("\\\\?\\D:\\long\\path"));
    assert(!PathValidator::FindForbiddenPathCharacter("/srv/field-reports"));
    assert(PathValidator::FindForbiddenPathCharacter("C:\\a:b") == ':');
    assert(PathValidator::FindForbiddenPathCharacter("/srv/a*b") == '*');
    assert(PathValidator::FindForbiddenPathCharacter(std::string("/srv/a\nb")) == '\n');

    // Cloud-sync classification is a case-insensitive marker match.
    assert(PathValidator::IsCloudSynced("C:\\Users\\fady\\OneDrive\\Desktop\\MAK_DRIVE"));
    assert(PathValidator::IsCloudSynced("/home/me/Dropbox/projects"));
    assert(PathValidator::IsCloudSynced("G:\\My Drive\\..\\Google Drive\\x"));
    assert(PathValidator::IsCloudSynced("/Users/me/Library/Mobile Documents/com~apple~CloudDocs"));
    assert(!PathValidator::IsCloudSynced("/srv/field-reports"));
    assert(!PathValidator::IsCloudSynced(scratch.str()));

    // Unique names really are unique.
    assert(PathValidator::MakeUniqueName(".probe") != PathValidator::MakeUniqueName(".probe"));

    std::cout << "[PASS] PathValidator Test." << std::endl;
    return 0;
}
