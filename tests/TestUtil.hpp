#ifndef TESTS_TEST_UTIL_HPP
#define TESTS_TEST_UTIL_HPP

#include <filesystem>
#include <locale>
#include <string>
#include <vector>

// Fresh directory under the system temp dir, removed with everything in it.
class TempDir {
public:
    TempDir();
    ~TempDir();

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& Path() const { return path_; }

private:
    std::filesystem::path path_;
};

// Switches the C and C++ global locales to one that uses ',' as decimal point,
// if any such locale is installed, and restores the previous ones afterwards.
class CommaDecimalLocale {
public:
    CommaDecimalLocale();
    ~CommaDecimalLocale();

    CommaDecimalLocale(const CommaDecimalLocale&) = delete;
    CommaDecimalLocale& operator=(const CommaDecimalLocale&) = delete;

    bool Active() const { return !name_.empty(); }
    const std::string& Name() const { return name_; }

private:
    std::string previous_c_locale_;
    std::locale previous_cpp_locale_;
    std::string name_;
};

void WriteTextFile(const std::filesystem::path& path, const std::string& content);
std::string ReadTextFile(const std::filesystem::path& path);
std::vector<std::string> ReadLines(const std::filesystem::path& path);

// Writes an executable stand-in for ffmpeg into dir and returns its path.
// Every invocation appends its arguments as one line to CallsLog(dir).
// Behaviour depends on the input file name:
//   *corrupt*   exits 1 with an error on stderr
//   *slow*      sleeps 30 s before doing anything
//   *nostats*   the measuring pass prints no loudnorm block
//   *empty*     the encoding pass exits 0 without writing
//   *failenc*   the encoding pass writes a partial file and exits 1
// Otherwise the measuring pass prints a loudnorm JSON block (dynamic) and the
// encoding pass prints -progress lines and writes a small file.
std::filesystem::path WriteFakeFfmpeg(const std::filesystem::path& dir);
std::filesystem::path CallsLog(const std::filesystem::path& dir);

// Value following "-i" in a recorded argument line.
std::string InputOfCall(const std::string& call);

#endif // TESTS_TEST_UTIL_HPP
