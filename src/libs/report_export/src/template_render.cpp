#include <report_export/template_render.hpp>
#include <pugixml.hpp>
#include <spdlog/spdlog.h>
#include <zip.h>
#include <algorithm>
#include <cctype>
#include <fstream>
#include <list>
#include <memory>
#include <sstream>

namespace report_export {

namespace {

struct ZipDiscard {
    void operator()(zip_t* archive) const { zip_discard(archive); }
};
using ZipArchive = std::unique_ptr<zip_t, ZipDiscard>;

struct ZipFileClose {
    void operator()(zip_file_t* file) const { zip_fclose(file); }
};

class TextNodeSubstituter : public pugi::xml_tree_walker {
public:
    explicit TextNodeSubstituter(const Replacements& replacements)
        : replacements_(replacements) {}

    bool for_each(pugi::xml_node& node) override {
        if (node.type() == pugi::node_pcdata || node.type() == pugi::node_cdata) {
            const std::string value = node.value();
            const std::string replaced = substitute_placeholders(value, replacements_);
            if (replaced != value) node.set_value(replaced.c_str());
        }
        return true;
    }

private:
    const Replacements& replacements_;
};

std::string zip_open_error(int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    return message;
}

bool is_zip_package(const std::string& data) {
    return data.size() >= 4 && data.compare(0, 4, "PK\x03\x04", 4) == 0;
}

std::optional<std::string> read_entry(zip_t* archive, zip_uint64_t index, zip_uint64_t size) {
    std::unique_ptr<zip_file_t, ZipFileClose> file(zip_fopen_index(archive, index, 0));
    if (!file) return std::nullopt;
    std::string data(size, '\0');
    zip_uint64_t done = 0;
    while (done < size) {
        const zip_int64_t n = zip_fread(file.get(), data.data() + done, size - done);
        if (n <= 0) return std::nullopt;
        done += static_cast<zip_uint64_t>(n);
    }
    return data;
}

bool render_package(const std::string& template_path, const std::string& out_path,
    const Replacements& replacements)
{
    int code = 0;
    ZipArchive in(zip_open(template_path.c_str(), ZIP_RDONLY, &code));
    if (!in) {
        spdlog::error("report_template zip_open_failed path={} err={}", template_path, zip_open_error(code));
        return false;
    }
    // Entry data must stay alive until the output archive is closed.
    std::list<std::string> contents;
    ZipArchive out(zip_open(out_path.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &code));
    if (!out) {
        spdlog::error("report_output zip_open_failed path={} err={}", out_path, zip_open_error(code));
        return false;
    }

    const zip_int64_t count = zip_get_num_entries(in.get(), 0);
    for (zip_int64_t i = 0; i < count; ++i) {
        const auto index = static_cast<zip_uint64_t>(i);
        zip_stat_t st;
        zip_stat_init(&st);
        if (zip_stat_index(in.get(), index, 0, &st) != 0 || !(st.valid & ZIP_STAT_NAME)
            || !(st.valid & ZIP_STAT_SIZE))
        {
            spdlog::error("report_template zip_stat_failed path={} index={}", template_path, i);
            return false;
        }
        const std::string name = st.name;

        if (!name.empty() && name.back() == '/') {
            if (zip_dir_add(out.get(), name.c_str(), ZIP_FL_ENC_UTF_8) < 0) {
                spdlog::error("report_output zip_dir_failed entry={} err={}", name, zip_strerror(out.get()));
                return false;
            }
            continue;
        }

        auto data = read_entry(in.get(), index, st.size);
        if (!data) {
            spdlog::error("report_template zip_read_failed path={} entry={}", template_path, name);
            return false;
        }
        if (is_section_entry(name)) {
            auto rendered = substitute_in_xml(*data, replacements);
            if (!rendered) {
                spdlog::error("report_template section_parse_failed path={} entry={}", template_path, name);
                return false;
            }
            data = std::move(rendered);
        }

        const std::string& stored = contents.emplace_back(std::move(*data));
        zip_source_t* source = zip_source_buffer(out.get(), stored.data(), stored.size(), 0);
        if (!source) {
            spdlog::error("report_output zip_source_failed entry={} err={}", name, zip_strerror(out.get()));
            return false;
        }
        const zip_int64_t added = zip_file_add(out.get(), name.c_str(), source, ZIP_FL_ENC_UTF_8);
        if (added < 0) {
            zip_source_free(source);
            spdlog::error("report_output zip_add_failed entry={} err={}", name, zip_strerror(out.get()));
            return false;
        }
        // The package type marker stays uncompressed.
        const zip_int32_t method = name == "mimetype" ? ZIP_CM_STORE : ZIP_CM_DEFLATE;
        if (zip_set_file_compression(out.get(), static_cast<zip_uint64_t>(added), method, 0) != 0) {
            spdlog::error("report_output zip_compression_failed entry={} err={}", name, zip_strerror(out.get()));
            return false;
        }
    }

    if (zip_close(out.get()) != 0) {
        spdlog::error("report_output zip_close_failed path={} err={}", out_path, zip_strerror(out.get()));
        return false;
    }
    out.release();
    return true;
}

bool render_document(const std::string& data, const std::string& template_path,
    const std::string& out_path, const Replacements& replacements)
{
    const auto rendered = substitute_in_xml(data, replacements);
    if (!rendered) {
        spdlog::error("report_template parse_failed path={}", template_path);
        return false;
    }
    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out) {
        spdlog::error("report_output open_failed path={}", out_path);
        return false;
    }
    out.write(rendered->data(), static_cast<std::streamsize>(rendered->size()));
    return static_cast<bool>(out);
}

} // namespace

std::string substitute_placeholders(std::string text, const Replacements& replacements) {
    for (const auto& [key, value] : replacements) {
        if (key.empty()) continue;
        std::size_t pos = 0;
        while ((pos = text.find(key, pos)) != std::string::npos) {
            text.replace(pos, key.size(), value);
            pos += value.size();
        }
    }
    return text;
}

std::optional<std::string> substitute_in_xml(const std::string& xml, const Replacements& replacements) {
    pugi::xml_document doc;
    const pugi::xml_parse_result parsed = doc.load_buffer(xml.data(), xml.size(),
        pugi::parse_full, pugi::encoding_utf8);
    if (!parsed) {
        spdlog::warn("report_template xml_error offset={} what={}", parsed.offset, parsed.description());
        return std::nullopt;
    }

    TextNodeSubstituter substituter(replacements);
    doc.traverse(substituter);

    std::ostringstream out;
    doc.save(out, "", pugi::format_raw | pugi::format_no_declaration, pugi::encoding_utf8);
    return out.str();
}

bool is_section_entry(const std::string& entry_name) {
    std::string lower = entry_name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    const std::string suffix = "contents/section0.xml";
    return lower.size() >= suffix.size() && lower.compare(lower.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool render_template(const std::string& template_path, const std::string& out_path,
    const Replacements& replacements)
{
    std::ifstream in(template_path, std::ios::binary);
    if (!in) {
        spdlog::error("report_template open_failed path={}", template_path);
        return false;
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    const std::string data = buffer.str();
    in.close();

    if (is_zip_package(data)) return render_package(template_path, out_path, replacements);
    return render_document(data, template_path, out_path, replacements);
}

} // namespace report_export
