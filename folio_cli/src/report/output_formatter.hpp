//
// Created by Giuseppe Francione on 17/02/26.
//

#ifndef FOLIO_OUTPUT_FORMATTER_HPP
#define FOLIO_OUTPUT_FORMATTER_HPP

#include "../cli/cli_parser.hpp"
#include "../../../libfolio/include/bookmark_index.hpp"
#include "../../../libfolio/include/document_assembler.hpp"
#include "../../../libfolio/include/models.hpp"
#include <filesystem>
#include <ostream>
#include <vector>

void print_info(std::ostream& os, const folio::PdfInfo& info, OutputFormat format);

/// @brief Text form: "{level}> {title}\t[{action} {page}]" per bookmark.
void print_bookmarks(std::ostream& os, const std::vector<folio::BookmarkNode>& bookmarks, OutputFormat format);

void print_text(std::ostream& os, const std::vector<folio::PageText>& pages, OutputFormat format);

void print_attachments(std::ostream& os, const std::vector<folio::Attachment>& attachments, OutputFormat format);

void print_form_fields(std::ostream& os, const std::vector<folio::FormField>& fields, OutputFormat format);

void print_page_objects(std::ostream& os, const std::vector<folio::PageObject>& objects, OutputFormat format);

/// @brief Lists files written by split, convert or extract-attachments, one per line.
void print_written_files(std::ostream& os, const std::vector<std::filesystem::path>& files);

void print_merge_summary(std::ostream& os, const folio::MergeSummary& summary, const std::filesystem::path& output);

#endif // FOLIO_OUTPUT_FORMATTER_HPP
