#pragma once
#include <string>
#include <vector>
#include <utility>
#include <nlohmann/json.hpp>

namespace sdp_assistant {

struct ParseNote {
    std::string entry_name;
    std::string message;
};

struct ArchiveStats {
    int systems = 0;
    int blocks = 0;
    int lines = 0;
    int xml_files = 0;

    nlohmann::json to_json() const {
        return {{"systems", systems}, {"blocks", blocks}, {"lines", lines}, {"xml_files", xml_files}};
    }
};

struct ArchiveSummary {
    std::string readable_text;
    ArchiveStats stats;
    std::vector<ParseNote> notes;
};

// The structural elements we recognise, keyed by bare tag name
enum class ElementKind { System, Block, Line, Other };

struct Connection {
    std::string source;
    std::string destination;
};

// Everything observed while walking the markup members of one archive
struct ModelInventory {
    int system_count = 0;
    std::vector<std::string> system_names;
    std::vector<std::string> block_names;
    std::vector<std::string> block_types;   // one per Block, "Unknown" when missing
    std::vector<Connection> connections;
    std::vector<ParseNote> notes;
    int xml_files = 0;
};

class ArchiveSummarizer {
public:
    static constexpr size_t kTopBlockTypes = 8;
    static constexpr size_t kExampleNames = 8;
    static constexpr size_t kMaxNotes = 4;

    // Throws InvalidArchiveError when the bytes are not a readable ZIP container
    static ArchiveSummary summarize(const std::string& archive_bytes, const std::string& display_name);

    // "ns:Block" -> "Block"
    static std::string local_name(const std::string& qualified_name);
    static ElementKind classify(const std::string& qualified_name);

    // Parses one markup member into the inventory; false + note on failure
    static bool scan_markup(const std::string& entry_name, const std::string& content, ModelInventory& inv);

    // Descending by count, ties in first-seen order, at most `top_n` entries
    static std::vector<std::pair<std::string, int>> rank_types(const std::vector<std::string>& types,
                                                               size_t top_n = kTopBlockTypes);

    static std::string render(const std::string& display_name, const ModelInventory& inv);
};

} // namespace sdp_assistant
