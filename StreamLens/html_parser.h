#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <cctype>
#include <stdexcept>

// Lexbor headers
#include <lexbor/html/parser.h>
#include <lexbor/dom/interfaces/document.h>
#include <lexbor/dom/interfaces/element.h>
#include <lexbor/dom/interfaces/node.h>
#include <lexbor/dom/interfaces/character_data.h>

#include "string_utils.h"
#include "url_utils.h"

using namespace std;

// Raised when extraction faults for reasons other than "nothing found"
// (the engine reports these as ParseError).
class ExtractionError : public runtime_error {
public:
    explicit ExtractionError(const string& what) : runtime_error(what) {}
};

struct HtmlMediaTag {
    string tag;     // source, video, link, meta, a
    string url;     // raw attribute value, possibly relative
    string label;   // quality hint from label/res/size/title attributes
};

// Everything the extraction strategies need from one page, gathered in a
// single lexbor pass.
struct PageScan {
    vector<HtmlMediaTag> mediaTags;
    vector<string> scripts;       // inline script bodies, document order
    vector<size_t> skippedScriptSizes;
    vector<string> iframes;       // iframe src / data-src, document order
    vector<string> idHints;       // <input name="id" value>, data-post
};

inline string elementAttribute(lxb_dom_element_t* el, const char* name) {
    size_t len = 0;
    const lxb_char_t* value = lxb_dom_element_get_attribute(el, (const lxb_char_t*)name, strlen(name), &len);
    if (!value || len == 0) return string();
    return trimWhitespace(string((const char*)value, len));
}

inline string elementTagName(lxb_dom_element_t* el) {
    size_t len = 0;
    const lxb_char_t* name = lxb_dom_element_local_name(el, &len);
    if (!name || len == 0) return string();
    return toLowerStr(string((const char*)name, len));
}

inline string firstNonEmptyAttribute(lxb_dom_element_t* el, const vector<const char*>& names) {
    for (const char* n : names) {
        string v = elementAttribute(el, n);
        if (!v.empty()) return v;
    }
    return string();
}

// Scripts longer than 'scriptSizeLimit' are recorded in skippedScriptSizes
// instead of being kept.
inline PageScan scanHtmlDocument(const string& html, size_t scriptSizeLimit) {
    PageScan scan;
    lxb_html_document_t* document = lxb_html_document_create();
    if (!document) throw ExtractionError("lexbor: cannot create document");
    lxb_status_t status = lxb_html_document_parse(document, (const lxb_char_t*)html.c_str(), html.size());
    if (status != LXB_STATUS_OK) {
        lxb_html_document_destroy(document);
        throw ExtractionError("lexbor: failed to parse document (status " + to_string((int)status) + ")");
    }

    static const vector<const char*> labelAttrs = { "label", "res", "data-res", "data-quality", "size", "title" };

    vector<lxb_dom_node_t*> stack;
    lxb_dom_node_t* start_node = lxb_dom_interface_node(document);
    if (start_node) stack.push_back(start_node);
    while (!stack.empty()) {
        lxb_dom_node_t* node = stack.back();
        stack.pop_back();
        if (!node) continue;
        if (node->type == LXB_DOM_NODE_TYPE_ELEMENT) {
            lxb_dom_element_t* el = lxb_dom_interface_element(node);
            string tag = elementTagName(el);

            if (tag == "source" || tag == "video") {
                string src = firstNonEmptyAttribute(el, { "src", "data-src" });
                if (!src.empty()) {
                    scan.mediaTags.push_back({ tag, src, firstNonEmptyAttribute(el, labelAttrs) });
                }
            }
            else if (tag == "link" || tag == "meta") {
                if (toLowerStr(elementAttribute(el, "itemprop")) == "contenturl") {
                    string href = firstNonEmptyAttribute(el, { "href", "content" });
                    if (!href.empty()) scan.mediaTags.push_back({ tag, href, string() });
                }
            }
            else if (tag == "a") {
                string href = elementAttribute(el, "href");
                if (!href.empty() && hasMediaExtension(href)) {
                    scan.mediaTags.push_back({ tag, href, firstNonEmptyAttribute(el, labelAttrs) });
                }
            }
            else if (tag == "iframe") {
                string src = firstNonEmptyAttribute(el, { "src", "data-src" });
                if (!src.empty() && src != "about:blank") scan.iframes.push_back(src);
            }
            else if (tag == "script") {
                if (elementAttribute(el, "src").empty()) {
                    size_t len = 0;
                    lxb_char_t* text = lxb_dom_node_text_content(node, &len);
                    if (text && len > 0) {
                        if (len > scriptSizeLimit) {
                            scan.skippedScriptSizes.push_back(len);
                        }
                        else {
                            scan.scripts.push_back(string((const char*)text, len));
                        }
                    }
                }
                continue; // script children are text only
            }
            else if (tag == "input") {
                if (toLowerStr(elementAttribute(el, "name")) == "id") {
                    string value = elementAttribute(el, "value");
                    if (!value.empty()) scan.idHints.push_back(value);
                }
            }

            string post = elementAttribute(el, "data-post");
            if (!post.empty()) scan.idHints.push_back(post);
        }
        if (node->last_child) {
            for (lxb_dom_node_t* child = node->last_child; child != nullptr; child = child->prev) {
                stack.push_back(child);
            }
        }
    }
    lxb_html_document_destroy(document);
    return scan;
}
