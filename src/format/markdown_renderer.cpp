#include "fluttersec/format/markdown_renderer.hpp"
#include "fluttersec/common/logger.hpp"

namespace fluttersec {
namespace format {

namespace {

constexpr unsigned int PARSER_FLAGS = MD_FLAG_TABLES | MD_FLAG_STRIKETHROUGH | MD_FLAG_TASKLISTS | MD_FLAG_NOHTML;

constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD = "\033[1m";
constexpr const char* CODE = "\033[48;5;235m\033[38;5;150m";

const char* headingColor(unsigned level) {
    switch (level) {
        case 1: return "\033[1;34m";
        case 2: return "\033[1;36m";
        default: return "\033[1;37m";
    }
}

}

MarkdownRenderer::MarkdownRenderer(MarkdownOutputFormat format, bool use_colors)
    : format_(format), use_colors_(use_colors) {
    resetState();
}

void MarkdownRenderer::resetState() {
    output_.clear();
    list_depth_ = 0;
    in_code_block_ = false;
    in_strong_ = false;
}

void MarkdownRenderer::style(const char* code) {
    if (use_colors_) {
        output_ += code;
    }
}

void MarkdownRenderer::restoreSpanStyle() {
    style(RESET);
    if (in_strong_) style(BOLD);
}

std::string MarkdownRenderer::render(const std::string& markdown) {
    resetState();

    if (format_ == MarkdownOutputFormat::HTML) {
        int rc = md_html(markdown.c_str(), static_cast<MD_SIZE>(markdown.size()),
                         htmlOutputCallback, this, PARSER_FLAGS, 0);
        if (rc != 0) {
            common::Logger::instance().warn("[Markdown] HTML render failed | rc={}", rc);
            return "<p>Error rendering markdown content.</p>";
        }
        return output_;
    }

    MD_PARSER parser = {
        0,
        PARSER_FLAGS,
        enterBlockCallback,
        leaveBlockCallback,
        enterSpanCallback,
        leaveSpanCallback,
        textCallback,
        nullptr,
        nullptr
    };

    if (md_parse(markdown.c_str(), static_cast<MD_SIZE>(markdown.size()), &parser, this) != 0) {
        common::Logger::instance().warn("[Markdown] ANSI render failed, using raw text");
        return markdown;
    }
    return output_;
}

void MarkdownRenderer::htmlOutputCallback(const MD_CHAR* text, MD_SIZE size, void* userdata) {
    static_cast<MarkdownRenderer*>(userdata)->output_.append(text, size);
}

int MarkdownRenderer::enterBlockCallback(MD_BLOCKTYPE type, void* detail, void* userdata) {
    return static_cast<MarkdownRenderer*>(userdata)->enterBlock(type, detail);
}

int MarkdownRenderer::leaveBlockCallback(MD_BLOCKTYPE type, void*, void* userdata) {
    return static_cast<MarkdownRenderer*>(userdata)->leaveBlock(type);
}

int MarkdownRenderer::enterSpanCallback(MD_SPANTYPE type, void*, void* userdata) {
    return static_cast<MarkdownRenderer*>(userdata)->enterSpan(type);
}

int MarkdownRenderer::leaveSpanCallback(MD_SPANTYPE type, void*, void* userdata) {
    return static_cast<MarkdownRenderer*>(userdata)->leaveSpan(type);
}

int MarkdownRenderer::textCallback(MD_TEXTTYPE type, const MD_CHAR* text, MD_SIZE size, void* userdata) {
    return static_cast<MarkdownRenderer*>(userdata)->text(type, text, size);
}

int MarkdownRenderer::enterBlock(MD_BLOCKTYPE type, void* detail) {
    switch (type) {
        case MD_BLOCK_H:
            output_ += "\n";
            style(headingColor(static_cast<MD_BLOCK_H_DETAIL*>(detail)->level));
            break;
        case MD_BLOCK_CODE:
            in_code_block_ = true;
            output_ += "\n";
            style(CODE);
            break;
        case MD_BLOCK_UL:
        case MD_BLOCK_OL:
            ++list_depth_;
            break;
        case MD_BLOCK_LI:
            output_ += std::string(static_cast<size_t>(list_depth_) * 2, ' ');
            style("\033[1;33m");
            output_ += "- ";
            style(RESET);
            break;
        case MD_BLOCK_HR:
            output_ += "\n" + std::string(60, '-') + "\n";
            break;
        case MD_BLOCK_TH:
            style(BOLD);
            break;
        default:
            break;
    }
    return 0;
}

int MarkdownRenderer::leaveBlock(MD_BLOCKTYPE type) {
    switch (type) {
        case MD_BLOCK_H:
            style(RESET);
            output_ += "\n";
            break;
        case MD_BLOCK_CODE:
            style(RESET);
            in_code_block_ = false;
            output_ += "\n";
            break;
        case MD_BLOCK_P:
            if (list_depth_ == 0) {
                output_ += "\n";
            }
            break;
        case MD_BLOCK_UL:
        case MD_BLOCK_OL:
            --list_depth_;
            break;
        case MD_BLOCK_LI:
        case MD_BLOCK_TR:
            if (output_.empty() || output_.back() != '\n') {
                output_ += "\n";
            }
            break;
        case MD_BLOCK_TH:
            style(RESET);
            output_ += "  ";
            break;
        case MD_BLOCK_TD:
            output_ += "  ";
            break;
        default:
            break;
    }
    return 0;
}

int MarkdownRenderer::enterSpan(MD_SPANTYPE type) {
    switch (type) {
        case MD_SPAN_STRONG:
            in_strong_ = true;
            style(BOLD);
            break;
        case MD_SPAN_EM:
            style("\033[3m");
            break;
        case MD_SPAN_CODE:
            if (!in_code_block_) style(CODE);
            break;
        case MD_SPAN_A:
            style("\033[4;36m");
            break;
        default:
            break;
    }
    return 0;
}

int MarkdownRenderer::leaveSpan(MD_SPANTYPE type) {
    switch (type) {
        case MD_SPAN_STRONG:
            in_strong_ = false;
            style("\033[22m");
            break;
        case MD_SPAN_EM:
            style("\033[23m");
            break;
        case MD_SPAN_CODE:
            if (!in_code_block_) restoreSpanStyle();
            break;
        case MD_SPAN_A:
            restoreSpanStyle();
            break;
        default:
            break;
    }
    return 0;
}

int MarkdownRenderer::text(MD_TEXTTYPE type, const MD_CHAR* text, MD_SIZE size) {
    switch (type) {
        case MD_TEXT_BR:
        case MD_TEXT_SOFTBR:
            output_ += "\n";
            if (list_depth_ > 0) {
                output_ += std::string(static_cast<size_t>(list_depth_) * 2 + 2, ' ');
            }
            break;
        case MD_TEXT_NULLCHAR:
            break;
        default:
            output_.append(text, size);
            break;
    }
    return 0;
}

}}
