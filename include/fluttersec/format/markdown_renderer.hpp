#pragma once

#include <string>
#include <md4c.h>
#include <md4c-html.h>

namespace fluttersec {
namespace format {

enum class MarkdownOutputFormat {
    HTML,
    ANSI_CONSOLE
};

class MarkdownRenderer {
public:
    explicit MarkdownRenderer(MarkdownOutputFormat format = MarkdownOutputFormat::HTML, bool use_colors = true);

    std::string render(const std::string& markdown);

private:
    MarkdownOutputFormat format_;
    bool use_colors_;
    std::string output_;

    int list_depth_ = 0;
    bool in_code_block_ = false;
    bool in_strong_ = false;

    void resetState();
    void style(const char* code);
    void restoreSpanStyle();

    static int enterBlockCallback(MD_BLOCKTYPE type, void* detail, void* userdata);
    static int leaveBlockCallback(MD_BLOCKTYPE type, void* detail, void* userdata);
    static int enterSpanCallback(MD_SPANTYPE type, void* detail, void* userdata);
    static int leaveSpanCallback(MD_SPANTYPE type, void* detail, void* userdata);
    static int textCallback(MD_TEXTTYPE type, const MD_CHAR* text, MD_SIZE size, void* userdata);
    static void htmlOutputCallback(const MD_CHAR* text, MD_SIZE size, void* userdata);

    int enterBlock(MD_BLOCKTYPE type, void* detail);
    int leaveBlock(MD_BLOCKTYPE type);
    int enterSpan(MD_SPANTYPE type);
    int leaveSpan(MD_SPANTYPE type);
    int text(MD_TEXTTYPE type, const MD_CHAR* text, MD_SIZE size);
};

}}
