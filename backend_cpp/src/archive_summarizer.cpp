#include "archive_summarizer.hpp"
#include "errors.hpp"
#include "text_utils.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <pugixml.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <sstream>
#include <unordered_map>

namespace sdp_assistant {

namespace {

// Owns a libarchive read handle for the lifetime of one summarize() call
struct ArchiveReader {
    archive* handle;
    ArchiveReader() : handle(archive_read_new()) {}
    ~ArchiveReader() {
        if (handle) {
            archive_read_close(handle);
            archive_read_free(handle);
        }
    }
    ArchiveReader(const ArchiveReader&) = delete;
    ArchiveReader& operator=(const ArchiveReader&) = delete;
};

std::string archive_error(archive* a) {
    const char* msg = archive_error_string(a);
    return msg ? std::string(msg) : std::string("unknown libarchive error");
}

// Reads the current entry's data, returns false with `error` set on failure
bool read_entry_data(archive* a, std::string& out, std::string& error) {
    const void* buff = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;
    while (true) {
        int rb = archive_read_data_block(a, &buff, &size, &offset);
        if (rb == ARCHIVE_EOF) return true;
        if (rb == ARCHIVE_WARN) {
            spdlog::warn("LIBARCHIVE WARN: {}", archive_error(a));
        } else if (rb != ARCHIVE_OK) {
            error = archive_error(a);
            return false;
        }
        if (size > 0) {
            if (static_cast<size_t>(offset) > out.size()) out.resize(static_cast<size_t>(offset), '\0');
            out.append(static_cast<const char*>(buff), size);
        }
    }
}

std::string param_child(const pugi::xml_node& node, const char* param_name) {
    for (pugi::xml_node child : node.children()) {
        if (ArchiveSummarizer::local_name(child.name()) == "P" &&
            std::string(child.attribute("Name").value()) == param_name) {
            return trim(child.text().get());
        }
    }
    return "";
}

class StructureWalker : public pugi::xml_tree_walker {
public:
    explicit StructureWalker(ModelInventory& inv) : inv_(inv) {}

    bool for_each(pugi::xml_node& node) override {
        if (node.type() != pugi::node_element) return true;

        switch (ArchiveSummarizer::classify(node.name())) {
            case ElementKind::System: {
                inv_.system_count++;
                pugi::xml_attribute name = node.attribute("Name");
                if (name) inv_.system_names.emplace_back(name.value());
                break;
            }
            case ElementKind::Block: {
                pugi::xml_attribute name = node.attribute("Name");
                if (name) inv_.block_names.emplace_back(name.value());
                pugi::xml_attribute type = node.attribute("BlockType");
                inv_.block_types.emplace_back(type ? type.value() : "Unknown");
                break;
            }
            case ElementKind::Line: {
                Connection c;
                pugi::xml_attribute src = node.attribute("Src");
                pugi::xml_attribute dst = node.attribute("Dst");
                c.source = src ? src.value() : param_child(node, "Src");
                c.destination = dst ? dst.value() : param_child(node, "Dst");
                inv_.connections.push_back(std::move(c));
                break;
            }
            case ElementKind::Other:
                break;
        }
        return true;
    }

private:
    ModelInventory& inv_;
};

void append_examples(std::ostringstream& out, const std::vector<std::string>& names, size_t limit) {
    if (names.empty()) {
        out << "- (none)\n";
        return;
    }
    size_t shown = std::min(limit, names.size());
    for (size_t i = 0; i < shown; ++i) out << "- " << names[i] << "\n";
    if (names.size() > limit) out << "- ... (+" << (names.size() - limit) << " more)\n";
}

} // namespace

std::string ArchiveSummarizer::local_name(const std::string& qualified_name) {
    auto colon = qualified_name.rfind(':');
    return colon == std::string::npos ? qualified_name : qualified_name.substr(colon + 1);
}

ElementKind ArchiveSummarizer::classify(const std::string& qualified_name) {
    const std::string tag = local_name(qualified_name);
    if (tag == "System") return ElementKind::System;
    if (tag == "Block") return ElementKind::Block;
    if (tag == "Line") return ElementKind::Line;
    return ElementKind::Other;
}

bool ArchiveSummarizer::scan_markup(const std::string& entry_name, const std::string& content, ModelInventory& inv) {
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_buffer(content.data(), content.size());
    if (!result) {
        std::string reason = std::string(result.description()) + " at offset " + std::to_string(result.offset);
        spdlog::warn("⚠️ Skipping unparseable member {}: {}", entry_name, reason);
        inv.notes.push_back({entry_name, reason});
        return false;
    }

    StructureWalker walker(inv);
    doc.traverse(walker);
    return true;
}

std::vector<std::pair<std::string, int>> ArchiveSummarizer::rank_types(const std::vector<std::string>& types,
                                                                       size_t top_n) {
    std::vector<std::pair<std::string, int>> histogram;
    std::unordered_map<std::string, size_t> index;
    for (const auto& t : types) {
        auto it = index.find(t);
        if (it == index.end()) {
            index.emplace(t, histogram.size());
            histogram.emplace_back(t, 1);
        } else {
            histogram[it->second].second++;
        }
    }

    std::stable_sort(histogram.begin(), histogram.end(),
                     [](const auto& a, const auto& b) { return a.second > b.second; });
    if (histogram.size() > top_n) histogram.resize(top_n);
    return histogram;
}

std::string ArchiveSummarizer::render(const std::string& display_name, const ModelInventory& inv) {
    std::ostringstream out;
    out << "SLX Model Overview: " << display_name << "\n";
    out << "XML files: " << inv.xml_files << "\n";
    out << "Systems: " << inv.system_count << "\n";
    out << "Blocks: " << inv.block_types.size() << "\n";
    out << "Lines (connections): " << inv.connections.size() << "\n";

    out << "\nTop block types:\n";
    auto ranked = rank_types(inv.block_types);
    if (ranked.empty()) out << "- (none)\n";
    for (const auto& [type, count] : ranked) out << "- " << type << ": " << count << "\n";

    out << "\nExample systems:\n";
    append_examples(out, inv.system_names, kExampleNames);

    out << "\nExample blocks:\n";
    append_examples(out, inv.block_names, kExampleNames);

    if (!inv.notes.empty()) {
        out << "\nParse notes:\n";
        size_t shown = std::min(kMaxNotes, inv.notes.size());
        for (size_t i = 0; i < shown; ++i) {
            out << "- " << inv.notes[i].entry_name << ": " << inv.notes[i].message << "\n";
        }
    }
    return out.str();
}

ArchiveSummary ArchiveSummarizer::summarize(const std::string& archive_bytes, const std::string& display_name) {
    if (archive_bytes.empty()) throw InvalidArchiveError("Archive is empty.");

    ArchiveReader reader;
    if (!reader.handle) throw std::runtime_error("archive_read_new failed");
    archive* in = reader.handle;
    archive_read_support_format_zip(in);

    int open_r = archive_read_open_memory(in, archive_bytes.data(), archive_bytes.size());
    if (open_r != ARCHIVE_OK && open_r != ARCHIVE_WARN) {
        throw InvalidArchiveError("Not a valid .slx (ZIP) container: " + archive_error(in));
    }

    ModelInventory inv;
    size_t entries_seen = 0;
    archive_entry* entry = nullptr;
    int r = ARCHIVE_OK;
    while ((r = archive_read_next_header(in, &entry)) == ARCHIVE_OK || r == ARCHIVE_WARN) {
        entries_seen++;
        const char* ename = archive_entry_pathname(entry);
        std::string name = ename ? ename : "";
        if (name.empty() || !ends_with_ci(name, ".xml")) {
            archive_read_data_skip(in);
            continue;
        }

        inv.xml_files++;
        std::string content;
        std::string error;
        if (!read_entry_data(in, content, error)) {
            spdlog::warn("⚠️ Could not read member {}: {}", name, error);
            inv.notes.push_back({name, error});
            continue;
        }
        scan_markup(name, content, inv);
    }

    if (r != ARCHIVE_EOF) {
        if (entries_seen == 0) {
            throw InvalidArchiveError("Not a valid .slx (ZIP) container: " + archive_error(in));
        }
        spdlog::error("❌ Iteration error after {} members: {}", entries_seen, archive_error(in));
        inv.notes.push_back({"(archive)", "iteration stopped: " + archive_error(in)});
    }

    ArchiveSummary summary;
    summary.stats.systems = inv.system_count;
    summary.stats.blocks = static_cast<int>(inv.block_types.size());
    summary.stats.lines = static_cast<int>(inv.connections.size());
    summary.stats.xml_files = inv.xml_files;
    summary.readable_text = render(display_name, inv);
    summary.notes = inv.notes;

    spdlog::info("📦 Summarized {}: {} xml, {} systems, {} blocks, {} lines, {} notes",
                 display_name, inv.xml_files, summary.stats.systems, summary.stats.blocks,
                 summary.stats.lines, inv.notes.size());
    return summary;
}

} // namespace sdp_assistant
