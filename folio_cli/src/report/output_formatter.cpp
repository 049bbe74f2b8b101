//
// Created by Giuseppe Francione on 17/02/26.
//

#include "output_formatter.hpp"
#include <json/json.h>
#include <cstdio>
#include <memory>
#include <string>

namespace {

void write_json(std::ostream& os, const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    const std::unique_ptr<Json::StreamWriter> writer(builder.newStreamWriter());
    writer->write(value, &os);
    os << '\n';
}

std::string fixed2(const double value) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

Json::Value bookmark_to_json(const folio::BookmarkNode& node) {
    Json::Value v(Json::objectValue);
    v["title"] = node.title;
    v["level"] = node.level;
    v["action"] = node.action ? Json::Value(std::string(folio::to_string(*node.action))) : Json::Value();
    v["page"] = node.page ? Json::Value(*node.page) : Json::Value();
    return v;
}

} // namespace

void print_info(std::ostream& os, const folio::PdfInfo& info, const OutputFormat format) {
    if (format == OutputFormat::Json) {
        Json::Value v(Json::objectValue);
        v["pages"] = info.pages;
        v["author"] = info.author;
        v["creation_date"] = info.creation_date;
        v["creator"] = info.creator;
        v["keywords"] = info.keywords;
        v["producer"] = info.producer;
        v["modified_date"] = info.modified_date;
        v["subject"] = info.subject;
        v["title"] = info.title;
        v["version"] = info.version;
        v["trapped"] = info.trapped;
        write_json(os, v);
        return;
    }
    os << "Pages = " << info.pages << '\n'
       << "Author = " << info.author << '\n'
       << "CreationDate = " << info.creation_date << '\n'
       << "Creator = " << info.creator << '\n'
       << "Keywords = " << info.keywords << '\n'
       << "Producer = " << info.producer << '\n'
       << "ModifiedDate = " << info.modified_date << '\n'
       << "Subject = " << info.subject << '\n'
       << "Title = " << info.title << '\n'
       << "Version = " << info.version << '\n'
       << "Trapped = " << info.trapped << '\n';
}

void print_bookmarks(std::ostream& os, const std::vector<folio::BookmarkNode>& bookmarks, const OutputFormat format) {
    if (format == OutputFormat::Json) {
        Json::Value list(Json::arrayValue);
        for (const auto& node : bookmarks) {
            list.append(bookmark_to_json(node));
        }
        write_json(os, list);
        return;
    }
    if (bookmarks.empty()) {
        os << "No bookmarks found\n";
        return;
    }
    for (const auto& node : bookmarks) {
        os << node.level << "> " << node.title << "\t[";
        if (node.action) os << folio::to_string(*node.action);
        os << ' ';
        if (node.page) os << *node.page;
        os << "]\n";
    }
}

void print_text(std::ostream& os, const std::vector<folio::PageText>& pages, const OutputFormat format) {
    if (format == OutputFormat::Json) {
        Json::Value list(Json::arrayValue);
        for (const auto& page : pages) {
            Json::Value v(Json::objectValue);
            v["page"] = page.page;
            v["characters"] = page.characters;
            v["words_count"] = page.words_count;
            v["text"] = page.text;
            Json::Value rects(Json::arrayValue);
            for (const auto& r : page.rects) {
                Json::Value rv(Json::objectValue);
                rv["left"] = r.left;
                rv["top"] = r.top;
                rv["right"] = r.right;
                rv["bottom"] = r.bottom;
                rects.append(rv);
            }
            v["rects"] = rects;
            list.append(v);
        }
        write_json(os, list);
        return;
    }
    for (const auto& page : pages) {
        os << page.text << '\n';
    }
}

void print_attachments(std::ostream& os, const std::vector<folio::Attachment>& attachments, const OutputFormat format) {
    if (format == OutputFormat::Json) {
        Json::Value list(Json::arrayValue);
        for (const auto& a : attachments) {
            Json::Value v(Json::objectValue);
            v["name"] = a.name;
            v["mime_type"] = a.mime_type;
            v["size"] = static_cast<Json::UInt64>(a.size);
            v["creation_date"] = a.creation_date;
            v["modification_date"] = a.modification_date;
            v["description"] = a.description;
            list.append(v);
        }
        write_json(os, list);
        return;
    }
    os << "Found " << attachments.size() << " attachments:\n";
    for (std::size_t i = 0; i < attachments.size(); ++i) {
        const auto& a = attachments[i];
        os << " - [" << i << "] " << a.name << " (" << a.size << " bytes";
        if (!a.mime_type.empty()) os << ", " << a.mime_type;
        os << ")";
        if (!a.description.empty()) os << " " << a.description;
        os << '\n';
    }
}

void print_form_fields(std::ostream& os, const std::vector<folio::FormField>& fields, const OutputFormat format) {
    if (format == OutputFormat::Json) {
        Json::Value list(Json::arrayValue);
        for (const auto& f : fields) {
            Json::Value v(Json::objectValue);
            v["page"] = f.page;
            v["name"] = f.name;
            v["type"] = f.type;
            v["value"] = f.value;
            v["rect"] = f.rect;
            list.append(v);
        }
        write_json(os, list);
        return;
    }
    os << "Found " << fields.size() << " form fields:\n";
    for (const auto& f : fields) {
        os << " - Page: " << f.page << ", Name: " << f.name << ", Type: " << f.type
           << ", Value: '" << f.value << "', Rect: " << f.rect << '\n';
    }
}

void print_page_objects(std::ostream& os, const std::vector<folio::PageObject>& objects, const OutputFormat format) {
    if (format == OutputFormat::Json) {
        Json::Value list(Json::arrayValue);
        for (const auto& o : objects) {
            Json::Value v(Json::objectValue);
            v["page"] = o.page;
            v["index"] = o.index;
            v["type"] = o.type;
            v["left"] = o.left;
            v["bottom"] = o.bottom;
            v["right"] = o.right;
            v["top"] = o.top;
            list.append(v);
        }
        write_json(os, list);
        return;
    }
    os << "Found " << objects.size() << " objects:\n";
    for (const auto& o : objects) {
        os << " - Page: " << o.page << ", Index: " << o.index << ", Type: " << o.type
           << ", Bounds: [L: " << fixed2(o.left) << ", B: " << fixed2(o.bottom)
           << ", R: " << fixed2(o.right) << ", T: " << fixed2(o.top) << "]\n";
    }
}

void print_written_files(std::ostream& os, const std::vector<std::filesystem::path>& files) {
    for (const auto& f : files) {
        os << f.string() << '\n';
    }
}

void print_merge_summary(std::ostream& os, const folio::MergeSummary& summary, const std::filesystem::path& output) {
    os << "Merged " << summary.merged_files << " files (" << summary.page_count << " pages) into "
       << output.string() << '\n';
    for (const auto& skipped : summary.skipped) {
        os << " - skipped " << skipped.string() << '\n';
    }
}
