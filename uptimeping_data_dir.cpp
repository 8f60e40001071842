#include "uptimeping_data_dir.hpp"

#include "call_errno.hpp"
#include "str.hpp"

#include <unistd.h>

#include <stdexcept>

void uptimeping_data_dir_prepare(std::filesystem::path const &dir) {
    std::filesystem::create_directories(dir);
    if (!std::filesystem::is_directory(dir)) { throw std::runtime_error(str("uptimeping_data_dir_prepare not a directory: ", dir)); }
    add_thread_context _("data_dir", dir.native());
    CALL_ERRNO_MINUS_1(access, dir.c_str(), R_OK | W_OK | X_OK);
}
