#pragma once

#include <gumbo.h>
#include <cstring>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "domain/Result.hpp"
#include "utils/InvoiceUtils.hpp"

namespace invoice::infrastructure::parsing
{
    using invoice::domain::ErrorCode;
    using invoice::domain::ErrorResult;
    using invoice::domain::Result;

    struct GumboOutputDeleter
    {
        void operator()(GumboOutput *output) const
        {
            if (output)
                gumbo_destroy_output(&kGumboDefaultOptions, output);
        }
    };

    using GumboOutputPtr = std::unique_ptr<GumboOutput, GumboOutputDeleter>;
    using NodePredicate = std::function<bool(const GumboNode *)>;

    /**
     * @brief gumbo 解析結果的 RAII 包裝，並提供擷取時需要的樹狀查詢
     */
    class HtmlDocument
    {
    public:
        static Result<HtmlDocument, ErrorResult> parse(const std::string &html)
        {
            GumboOutput *output = gumbo_parse_with_options(&kGumboDefaultOptions, html.data(), html.size());
            if (!output || !output->root)
            {
                GumboOutputDeleter{}(output);
                return Result<HtmlDocument, ErrorResult>::Err(
                    ErrorResult{ErrorCode::ExtractionFailed, "gumbo could not parse the document"});
            }
            return Result<HtmlDocument, ErrorResult>::Ok(HtmlDocument(GumboOutputPtr(output)));
        }

        const GumboNode *root() const noexcept { return output_->root; }

        // === 節點判斷 ===
        static bool isElement(const GumboNode *node) noexcept
        {
            return node && node->type == GUMBO_NODE_ELEMENT;
        }

        static bool isTag(const GumboNode *node, GumboTag tag) noexcept
        {
            return isElement(node) && node->v.element.tag == tag;
        }

        static std::optional<std::string> attribute(const GumboNode *node, const char *name)
        {
            if (!isElement(node))
                return std::nullopt;
            const GumboAttribute *attr = gumbo_get_attribute(&node->v.element.attributes, name);
            if (!attr)
                return std::nullopt;
            return std::string(attr->value);
        }

        // class 屬性字串包含 fragment (子字串比對，"row" 也會命中 "row-fluid")
        static bool classContains(const GumboNode *node, const std::string &fragment)
        {
            auto cls = attribute(node, "class");
            return cls && cls->find(fragment) != std::string::npos;
        }

        // class 屬性中有完整的 token
        static bool hasClass(const GumboNode *node, const std::string &token)
        {
            auto cls = attribute(node, "class");
            if (!cls)
                return false;
            std::vector<std::string> tokens;
            boost::algorithm::split(tokens, *cls, boost::algorithm::is_space(), boost::algorithm::token_compress_on);
            for (const auto &t : tokens)
            {
                if (t == token)
                    return true;
            }
            return false;
        }

        // === 文字 ===
        // 元素底下所有文字 (略過 script/style)，空白已壓縮
        static std::string text(const GumboNode *node)
        {
            std::string raw;
            appendText(node, raw);
            return utils::InvoiceUtils::collapseWhitespace(raw);
        }

        // === 走訪 ===
        static const GumboVector *children(const GumboNode *node) noexcept
        {
            if (!node)
                return nullptr;
            if (node->type == GUMBO_NODE_ELEMENT || node->type == GUMBO_NODE_TEMPLATE)
                return &node->v.element.children;
            if (node->type == GUMBO_NODE_DOCUMENT)
                return &node->v.document.children;
            return nullptr;
        }

        // 依文件順序 (前序) 收集符合條件的後代元素，不含 node 本身
        static std::vector<const GumboNode *> findAll(const GumboNode *node, const NodePredicate &predicate)
        {
            std::vector<const GumboNode *> found;
            const GumboVector *kids = children(node);
            if (!kids)
                return found;
            for (unsigned int i = 0; i < kids->length; ++i)
            {
                collect(static_cast<const GumboNode *>(kids->data[i]), predicate, found);
            }
            return found;
        }

        static std::vector<const GumboNode *> findAllTags(const GumboNode *node, GumboTag tag)
        {
            return findAll(node, [tag](const GumboNode *n)
                           { return isTag(n, tag); });
        }

        static const GumboNode *findFirst(const GumboNode *node, const NodePredicate &predicate)
        {
            auto found = findAll(node, predicate);
            return found.empty() ? nullptr : found.front();
        }

        static const GumboNode *parent(const GumboNode *node) noexcept
        {
            return node ? node->parent : nullptr;
        }

        // 之後的兄弟元素 (略過文字節點)
        static std::vector<const GumboNode *> followingSiblings(const GumboNode *node)
        {
            std::vector<const GumboNode *> siblings;
            const GumboVector *kids = children(parent(node));
            if (!kids)
                return siblings;
            for (unsigned int i = static_cast<unsigned int>(node->index_within_parent) + 1; i < kids->length; ++i)
            {
                const auto *sibling = static_cast<const GumboNode *>(kids->data[i]);
                if (isElement(sibling))
                    siblings.push_back(sibling);
            }
            return siblings;
        }

        static const GumboNode *nextElementSibling(const GumboNode *node)
        {
            auto siblings = followingSiblings(node);
            return siblings.empty() ? nullptr : siblings.front();
        }

    private:
        explicit HtmlDocument(GumboOutputPtr output) : output_(std::move(output)) {}

        static void collect(const GumboNode *node, const NodePredicate &predicate, std::vector<const GumboNode *> &found)
        {
            if (!isElement(node))
                return;
            if (predicate(node))
                found.push_back(node);
            const GumboVector *kids = children(node);
            for (unsigned int i = 0; i < kids->length; ++i)
            {
                collect(static_cast<const GumboNode *>(kids->data[i]), predicate, found);
            }
        }

        static void appendText(const GumboNode *node, std::string &out)
        {
            if (!node)
                return;
            if (node->type == GUMBO_NODE_TEXT || node->type == GUMBO_NODE_WHITESPACE || node->type == GUMBO_NODE_CDATA)
            {
                out.append(node->v.text.text);
                return;
            }
            if (!isElement(node))
                return;
            if (node->v.element.tag == GUMBO_TAG_SCRIPT || node->v.element.tag == GUMBO_TAG_STYLE)
                return;

            const GumboVector *kids = children(node);
            for (unsigned int i = 0; i < kids->length; ++i)
            {
                appendText(static_cast<const GumboNode *>(kids->data[i]), out);
            }
            // 區塊元素之間補空白，避免相鄰儲存格文字黏在一起
            out.push_back(' ');
        }

        GumboOutputPtr output_;
    };

} // namespace invoice::infrastructure::parsing
