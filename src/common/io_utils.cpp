#include "common/io_utils.hpp"
#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <cerrno>
#include <fstream>
#include <system_error>
#include <vector>
#include "common/exceptions.hpp"

namespace sandbox {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::binary);
    if (!fin) throw_errno(errno, "unable to open file '{}'", path.string());
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    if (!fout) throw_errno(errno, "unable to create file '{}'", path.string());
    fout.write(content.data(), content.size());
    if (!fout) throw_errno(errno, "unable to write file '{}'", path.string());
}

/**
 * @brief 返回从 i 开始的合法 UTF-8 字符的字节数，不合法时返回 0
 */
static size_t utf8_sequence_length(const string &string, size_t i) {
    size_t ix = string.length();
    unsigned char c = string[i];
    size_t n;
    if (c <= 0x7f)
        return 1;  // 0bbbbbbb
    else if ((c & 0xE0) == 0xC0 && c >= 0xC2)
        n = 1;  // 110bbbbb
    else if (c == 0xed && i + 1 < ix && ((unsigned char)string[i + 1] & 0xa0) == 0xa0)
        return 0;  // U+d800 to U+dfff
    else if ((c & 0xF0) == 0xE0)
        n = 2;  // 1110bbbb
    else if ((c & 0xF8) == 0xF0 && c <= 0xF4)
        n = 3;  // 11110bbb
    else
        return 0;
    for (size_t j = 1; j <= n; j++) {  // n bytes matching 10bbbbbb follow ?
        if (i + j >= ix || ((unsigned char)string[i + j] & 0xC0) != 0x80)
            return 0;
    }
    return n + 1;
}

bool utf8_check_is_valid(const string &string) {
    for (size_t i = 0; i < string.length();) {
        size_t n = utf8_sequence_length(string, i);
        if (n == 0) return false;
        i += n;
    }
    return true;
}

string utf8_sanitize(const string &string) {
    static const char replacement[] = "\xEF\xBF\xBD";
    std::string result;
    result.reserve(string.length());
    for (size_t i = 0; i < string.length();) {
        size_t n = utf8_sequence_length(string, i);
        if (n == 0) {
            result += replacement;
            ++i;
        } else {
            result.append(string, i, n);
            i += n;
        }
    }
    return result;
}

size_t utf8_truncate_position(const string &string, size_t limit) {
    if (string.length() <= limit) return string.length();
    size_t pos = limit;
    // 回退到字符边界，续字节的格式为 10bbbbbb
    while (pos > 0 && ((unsigned char)string[pos] & 0xC0) == 0x80) --pos;
    return pos;
}

scratch_directory::scratch_directory(const fs::path &root) : valid(false) {
    string pattern = (root / "pysandbox-XXXXXX").string();
    vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (!mkdtemp(buffer.data()))
        throw spawn_error(errno, "unable to create scratch directory under " + root.string());
    dir = fs::path(buffer.data());
    valid = true;
}

scratch_directory::scratch_directory(scratch_directory &&other)
    : dir(move(other.dir)), valid(other.valid) {
    other.valid = false;
}

scratch_directory::~scratch_directory() {
    release();
}

scratch_directory &scratch_directory::operator=(scratch_directory &&other) {
    if (this != &other) {
        release();
        dir = move(other.dir);
        valid = other.valid;
        other.valid = false;
    }
    return *this;
}

const fs::path &scratch_directory::path() const {
    return dir;
}

void scratch_directory::release() {
    if (!valid) return;
    valid = false;
    error_code ec;
    fs::remove_all(dir, ec);
    if (ec) LOG(ERROR) << "unable to remove scratch directory " << dir << ": " << ec.message();
}

}  // namespace sandbox
