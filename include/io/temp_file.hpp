#pragma once

#include "io/fd.hpp"
#include "util/result.hpp"

#include <string>
#include <string_view>

namespace swi {

// A mkstemp() file that is unlinked on destruction unless Keep() was called.
class TempFile {
public:
    // `suffix` (e.g. ".swi") is kept after the random part of the name.
    static Result Create(std::string_view dir,
                         std::string_view prefix,
                         std::string_view suffix,
                         TempFile& out);

    TempFile();
    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
    TempFile(TempFile&& other) noexcept;
    TempFile& operator=(TempFile&& other) noexcept;
    ~TempFile();

    int GetFd() const;
    const std::string& Path() const;
    void Close();

    // Closes the descriptor and hands the file over to the caller.
    std::string Keep();

private:
    void Cleanup();

    Fd fd_;
    std::string path_;
};

} // namespace swi
