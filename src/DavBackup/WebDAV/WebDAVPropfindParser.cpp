/*
 * This Source Code Form is subject to the terms of the Mozilla Public
 * License, v. 2.0. If a copy of the MPL was not distributed with this
 * file, You can obtain one at https://mozilla.org/MPL/2.0/.
 *
 * Copyright (c) 2025 Jonathan "Geenz" Goodman
 * This file is part of the DavBackup project.
 */
#include "DavBackup/WebDAV/WebDAVPropfindParser.h"

#include <tinyxml2.h>
#include <cstdlib>
#include <string_view>
#include "DavBackup/WebDAV/WebDAVUtils.h"

namespace DavBackup::WebDAV {

using tinyxml2::XMLElement;

static std::string_view localName(const char* qn) {
    std::string_view q = qn ? qn : "";
    auto p = q.find_last_of(':');
    return (p == std::string_view::npos) ? q : q.substr(p + 1);
}

static XMLElement* firstByLocal(XMLElement* parent, std::string_view name) {
    for (auto* e = parent ? parent->FirstChildElement() : nullptr; e; e = e->NextSiblingElement()) {
        if (localName(e->Name()) == name) return e;
    }
    return nullptr;
}

static std::string trimmed(const char* text) {
    std::string_view v = text ? text : "";
    auto b = v.find_first_not_of(" \t\r\n");
    if (b == std::string_view::npos) return {};
    auto e = v.find_last_not_of(" \t\r\n");
    return std::string(v.substr(b, e - b + 1));
}

Result<std::vector<DavResourceInfo>> parsePropfindXml(const std::vector<uint8_t>& xmlBytes) {
    using R = Result<std::vector<DavResourceInfo>>;
    if (xmlBytes.empty()) {
        return R::err(StorageError::ProtocolFailure, "Empty PROPFIND response body");
    }

    tinyxml2::XMLDocument doc;
    if (doc.Parse(reinterpret_cast<const char*>(xmlBytes.data()), xmlBytes.size()) != tinyxml2::XML_SUCCESS) {
        return R::err(StorageError::ProtocolFailure,
                      std::string("Malformed PROPFIND response: ") + (doc.ErrorStr() ? doc.ErrorStr() : "parse error"));
    }

    auto* ms = doc.FirstChildElement();
    if (!ms || localName(ms->Name()) != "multistatus") {
        return R::err(StorageError::ProtocolFailure, "PROPFIND response is not a multistatus document");
    }

    std::vector<DavResourceInfo> out;
    for (auto* resp = ms->FirstChildElement(); resp; resp = resp->NextSiblingElement()) {
        if (localName(resp->Name()) != "response") continue;

        DavResourceInfo ri;
        if (auto* href = firstByLocal(resp, "href"); href && href->GetText()) {
            ri.href = trimmed(href->GetText());
        } else {
            continue; // skip entries without href
        }

        XMLElement* okProp = nullptr;
        for (auto* ps = firstByLocal(resp, "propstat"); ps; ps = ps->NextSiblingElement()) {
            if (localName(ps->Name()) != "propstat") continue;
            if (auto* st = firstByLocal(ps, "status"); st && st->GetText()) {
                if (std::string_view(st->GetText()).find(" 200 ") != std::string_view::npos) {
                    okProp = firstByLocal(ps, "prop");
                    break;
                }
            }
        }
        if (!okProp) {
            // Fall back to the first propstat regardless of status, then a bare prop
            if (auto* ps = firstByLocal(resp, "propstat")) okProp = firstByLocal(ps, "prop");
        }
        if (!okProp) okProp = firstByLocal(resp, "prop");
        ri.hasProp = (okProp != nullptr);

        if (auto* rt = firstByLocal(okProp, "resourcetype")) {
            ri.isCollection = (firstByLocal(rt, "collection") != nullptr);
        }
        if (auto* gcl = firstByLocal(okProp, "getcontentlength"); gcl && gcl->GetText()) {
            auto text = trimmed(gcl->GetText());
            char* end = nullptr;
            unsigned long long n = std::strtoull(text.c_str(), &end, 10);
            if (!text.empty() && end && *end == '\0') ri.contentLength = n;
        }
        if (auto* gct = firstByLocal(okProp, "getcontenttype"); gct && gct->GetText()) {
            ri.contentType = trimmed(gct->GetText());
        }
        if (auto* dn = firstByLocal(okProp, "displayname"); dn && dn->GetText()) {
            ri.displayName = trimmed(dn->GetText());
        }
        if (auto* glm = firstByLocal(okProp, "getlastmodified"); glm && glm->GetText()) {
            ri.lastModifiedRaw = trimmed(glm->GetText());
            ri.lastModified = Utils::parseHttpDate(ri.lastModifiedRaw->c_str());
        }

        out.push_back(std::move(ri));
    }

    return R::ok(std::move(out));
}

} // namespace DavBackup::WebDAV
