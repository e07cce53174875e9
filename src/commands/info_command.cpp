// =============================================================================
// linkx - Info Command Implementation
// =============================================================================

#include "info_command.h"

#include <array>
#include <string>
#include <utility>

#include <fmt/format.h>

#include "linkx/common/logger.h"
#include "linkx/format/link_format.h"
#include "linkx/io/block_sink.h"
#include "linkx/io/data_file.h"

namespace linkx::commands {

namespace {

std::string hexTag(const std::array<std::uint8_t, 4>& tag) {
    std::string text;
    for (auto byte : tag) {
        text += fmt::format("{:02x}", byte);
    }
    return text;
}

std::string escapeJson(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char c : text) {
        switch (c) {
            case '"':
                escaped += "\\\"";
                break;
            case '\\':
                escaped += "\\\\";
                break;
            case '\n':
                escaped += "\\n";
                break;
            case '\r':
                escaped += "\\r";
                break;
            case '\t':
                escaped += "\\t";
                break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    escaped += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
                } else {
                    escaped += c;
                }
        }
    }
    return escaped;
}

}  // namespace

// =============================================================================
// InfoCommand Implementation
// =============================================================================

InfoCommand::InfoCommand(InfoOptions options, std::ostream& out)
    : options_(std::move(options)), out_(out) {}

InfoCommand::~InfoCommand() = default;

int InfoCommand::execute() {
    try {
        auto index = format::readIndexFile(options_.indexPath);

        std::optional<std::uint64_t> dataSize;
        if (options_.dataPath) {
            io::DataFile data(*options_.dataPath);
            data.open();
            dataSize = data.size();
        }

        if (options_.jsonOutput) {
            printJsonInfo(index, dataSize);
        } else {
            printTextInfo(index, dataSize);
        }
        return 0;

    } catch (const LinkxException& e) {
        LINKX_LOG_ERROR("Info command failed: {}", e.what());
        return e.exitCode();
    } catch (const std::exception& e) {
        LINKX_LOG_ERROR("Unexpected error: {}", e.what());
        return toExitCode(ErrorCode::kIOError);
    }
}

void InfoCommand::printTextInfo(const format::IndexReadResult& index,
                                std::optional<std::uint64_t> dataSize) {
    out_ << "=== Link Index Information ===\n\n";
    out_ << "Index:          " << options_.indexPath.string() << "\n";
    out_ << "Size:           " << index.totalSize << " bytes\n";
    out_ << "Records:        " << index.records.size() << "\n";
    if (index.truncated()) {
        out_ << "Truncated:      yes (" << index.trailingBytes << " trailing bytes)\n";
    }
    if (dataSize) {
        out_ << "Data size:      " << *dataSize << " bytes\n";
    }
    out_ << "\n";

    const std::size_t width = io::paddingWidth(index.records.size());
    out_ << fmt::format("{:>{}}  {:>12}  {:>12}  {:>12}  {:<8}  {:>8}  {:<8}  {:<8}{}\n", "#",
                        width, "offset", "uncompressed", "compressed", "method", "reserved",
                        "tag0", "tag1", dataSize ? "  range" : "");

    for (std::size_t i = 0; i < index.records.size(); ++i) {
        const auto& record = index.records[i];
        std::string range;
        if (dataSize) {
            range = record.fitsWithin(*dataSize) ? "  ok" : "  INVALID";
        }
        out_ << fmt::format("{:>{}}  {:>12}  {:>12}  {:>12}  {:<8}  {:>8x}  {:<8}  {:<8}{}\n",
                            i + kFirstBlockId, width, record.offset, record.uncompressedSize,
                            record.compressedSize,
                            format::compressionMethodName(record.methodCode()),
                            record.methodReserved(), hexTag(record.tag0), hexTag(record.tag1),
                            range);
    }
}

void InfoCommand::printJsonInfo(const format::IndexReadResult& index,
                                std::optional<std::uint64_t> dataSize) {
    out_ << "{\n";
    out_ << "  \"index\": \"" << escapeJson(options_.indexPath.string()) << "\",\n";
    out_ << "  \"size\": " << index.totalSize << ",\n";
    out_ << "  \"truncated\": " << (index.truncated() ? "true" : "false") << ",\n";
    out_ << "  \"trailing_bytes\": " << index.trailingBytes << ",\n";
    if (dataSize) {
        out_ << "  \"data_size\": " << *dataSize << ",\n";
    }
    out_ << "  \"records\": [";

    for (std::size_t i = 0; i < index.records.size(); ++i) {
        const auto& record = index.records[i];
        out_ << (i == 0 ? "\n" : ",\n");
        out_ << "    {";
        out_ << "\"block\": " << i + kFirstBlockId;
        out_ << ", \"offset\": " << record.offset;
        out_ << ", \"uncompressed_size\": " << record.uncompressedSize;
        out_ << ", \"compressed_size\": " << record.compressedSize;
        out_ << ", \"method\": " << static_cast<unsigned>(record.methodCode());
        out_ << ", \"method_reserved\": " << record.methodReserved();
        out_ << ", \"tag0\": \"" << hexTag(record.tag0) << "\"";
        out_ << ", \"tag1\": \"" << hexTag(record.tag1) << "\"";
        if (dataSize) {
            out_ << ", \"in_range\": " << (record.fitsWithin(*dataSize) ? "true" : "false");
        }
        out_ << "}";
    }

    out_ << (index.records.empty() ? "]\n" : "\n  ]\n");
    out_ << "}\n";
}

}  // namespace linkx::commands
