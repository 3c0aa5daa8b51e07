#include "compress_error.hpp"

#include <string>

namespace DocPack
{
namespace
{
class CompressErrorCategoryImpl final : public std::error_category {
public:
    const char* name() const noexcept override {
        return "docpack.compress";
    }

    std::string message(int value) const override {
        switch (static_cast<CompressErrorCode>(value)) {
        case CompressErrorCode::Success: return "success";
        case CompressErrorCode::InitFailed: return "deflate stream init failed";
        case CompressErrorCode::DeflateFailed: return "deflate stream failed";
        default: return "unknown compress error";
        }
    }
};
} // namespace

const std::error_category& CompressErrorCategory() noexcept {
    static const CompressErrorCategoryImpl s_category;
    return s_category;
}

void ThrowCompressError(CompressErrorCode code, std::string_view details) {
    throw std::system_error(MakeCompressError(code), std::string(details));
}
} // namespace DocPack
