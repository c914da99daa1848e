/**
 * @file cert_ops.cpp
 * @brief Read-only X.509 operations implementation
 */

#include "certmgr/pki/cert_ops.h"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <regex>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/objects.h>
#include <openssl/x509v3.h>

namespace certmgr::pki {

namespace {

std::string nameOneline(X509_NAME* name) {
    if (!name) return "";
    char* dn = X509_NAME_oneline(name, nullptr, 0);
    if (!dn) return "";
    std::string result(dn);
    OPENSSL_free(dn);
    return result;
}

std::optional<std::string> componentByNid(X509_NAME* name, int nid) {
    if (!name) return std::nullopt;
    int idx = X509_NAME_get_index_by_NID(name, nid, -1);
    if (idx < 0) return std::nullopt;

    X509_NAME_ENTRY* entry = X509_NAME_get_entry(name, idx);
    ASN1_STRING* data = entry ? X509_NAME_ENTRY_get_data(entry) : nullptr;
    if (!data) return std::nullopt;

    unsigned char* utf8 = nullptr;
    int len = ASN1_STRING_to_UTF8(&utf8, data);
    if (len < 0) {
        ERR_clear_error();
        return std::nullopt;
    }
    std::string value(reinterpret_cast<char*>(utf8), static_cast<size_t>(len));
    OPENSSL_free(utf8);
    return value;
}

std::string ipAddressToString(const ASN1_OCTET_STRING* ip) {
    const unsigned char* p = ASN1_STRING_get0_data(ip);
    int len = ASN1_STRING_length(ip);
    char buf[64];

    if (len == 4) {
        std::snprintf(buf, sizeof(buf), "%d.%d.%d.%d", p[0], p[1], p[2], p[3]);
        return buf;
    }
    if (len == 16) {
        std::string out;
        for (int i = 0; i < 16; i += 2) {
            std::snprintf(buf, sizeof(buf), "%x", (p[i] << 8) | p[i + 1]);
            if (i > 0) out += ":";
            out += buf;
        }
        return out;
    }
    return "";
}

std::vector<std::string> sanValues(GENERAL_NAMES* names) {
    std::vector<std::string> values;
    if (!names) return values;

    for (int i = 0; i < sk_GENERAL_NAME_num(names); ++i) {
        GENERAL_NAME* gn = sk_GENERAL_NAME_value(names, i);
        if (gn->type == GEN_DNS) {
            const auto* s = ASN1_STRING_get0_data(gn->d.dNSName);
            values.emplace_back(reinterpret_cast<const char*>(s),
                                static_cast<size_t>(ASN1_STRING_length(gn->d.dNSName)));
        } else if (gn->type == GEN_IPADD) {
            std::string ip = ipAddressToString(gn->d.iPAddress);
            if (!ip.empty()) values.push_back(ip);
        }
    }
    return values;
}

SubjectFields fieldsFromName(X509_NAME* name) {
    SubjectFields fields;
    fields.country = componentByNid(name, NID_countryName);
    fields.state = componentByNid(name, NID_stateOrProvinceName);
    fields.city = componentByNid(name, NID_localityName);
    fields.organization = componentByNid(name, NID_organizationName);
    fields.organizationalUnit = componentByNid(name, NID_organizationalUnitName);
    fields.commonName = componentByNid(name, NID_commonName);
    fields.email = componentByNid(name, NID_pkcs9_emailAddress);
    return fields;
}

std::string upper(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    return s;
}

} // anonymous namespace

// --- Subject ---

std::string getSubjectDn(X509* cert) {
    if (!cert) return "";
    return nameOneline(X509_get_subject_name(cert));
}

std::string getRequestSubjectDn(X509_REQ* req) {
    if (!req) return "";
    return nameOneline(X509_REQ_get_subject_name(req));
}

SubjectFields getSubjectFields(X509* cert) {
    if (!cert) return {};
    SubjectFields fields = fieldsFromName(X509_get_subject_name(cert));

    auto* names = static_cast<GENERAL_NAMES*>(
        X509_get_ext_d2i(cert, NID_subject_alt_name, nullptr, nullptr));
    fields.san = sanValues(names);
    GENERAL_NAMES_free(names);
    return fields;
}

SubjectFields getRequestSubjectFields(X509_REQ* req) {
    if (!req) return {};
    SubjectFields fields = fieldsFromName(X509_REQ_get_subject_name(req));

    STACK_OF(X509_EXTENSION)* exts = X509_REQ_get_extensions(req);
    if (exts) {
        auto* names = static_cast<GENERAL_NAMES*>(
            X509V3_get_d2i(exts, NID_subject_alt_name, nullptr, nullptr));
        fields.san = sanValues(names);
        GENERAL_NAMES_free(names);
        sk_X509_EXTENSION_pop_free(exts, X509_EXTENSION_free);
    }
    ERR_clear_error();
    return fields;
}

// --- Decoding ---

std::optional<int64_t> getSerialNumber(X509* cert) {
    if (!cert) return std::nullopt;
    int64_t serial = 0;
    if (ASN1_INTEGER_get_int64(&serial, X509_get0_serialNumber(cert)) != 1 || serial < 0) {
        ERR_clear_error();
        return std::nullopt;
    }
    return serial;
}

std::optional<std::string> getDigestAlgorithm(X509* cert) {
    if (!cert) return std::nullopt;
    const char* ln = OBJ_nid2ln(X509_get_signature_nid(cert));
    if (!ln) return std::nullopt;

    static const std::regex digestPrefix("^(.+)[Ww]ith");
    std::smatch m;
    std::string name(ln);
    if (!std::regex_search(name, m, digestPrefix)) return std::nullopt;
    return upper(m[1].str());
}

CertificateInfo getCertificateInfo(X509* cert) {
    CertificateInfo info;
    if (!cert) return info;
    info.subject = getSubjectFields(cert);
    info.serial = getSerialNumber(cert);
    info.digestAlgorithm = getDigestAlgorithm(cert);
    return info;
}

// --- Validity ---

std::optional<std::string> formatCtime(const ASN1_TIME* t) {
    if (!t) return std::nullopt;
    struct tm tm {};
    if (ASN1_TIME_to_tm(t, &tm) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }
    char buf[64];
    if (std::strftime(buf, sizeof(buf), "%a %b %e %H:%M:%S %Y", &tm) == 0) return std::nullopt;
    return std::string(buf);
}

std::optional<std::string> getNotBefore(X509* cert) {
    if (!cert) return std::nullopt;
    return formatCtime(X509_get0_notBefore(cert));
}

std::optional<std::string> getNotAfter(X509* cert) {
    if (!cert) return std::nullopt;
    return formatCtime(X509_get0_notAfter(cert));
}

std::optional<int> daysUntilExpiry(X509* cert) {
    if (!cert) return std::nullopt;
    int days = 0;
    int seconds = 0;
    // nullptr "from" means now
    if (ASN1_TIME_diff(&days, &seconds, nullptr, X509_get0_notAfter(cert)) != 1) {
        ERR_clear_error();
        return std::nullopt;
    }
    if (days <= 0 && seconds < 0) {
        days -= 1;
    }
    return days;
}

// --- Fingerprint ---

std::string getSha1Fingerprint(X509* cert) {
    if (!cert) return "";

    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int mdLen = 0;
    if (X509_digest(cert, EVP_sha1(), md, &mdLen) != 1) {
        ERR_clear_error();
        return "";
    }

    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(mdLen * 3);
    for (unsigned int i = 0; i < mdLen; ++i) {
        if (i > 0) out += ':';
        out += hex[md[i] >> 4];
        out += hex[md[i] & 0x0F];
    }
    return out;
}

// --- Key Matching ---

bool keyMatchesCertificate(X509* cert, EVP_PKEY* key) {
    if (!cert || !key) return false;
    bool matches = X509_check_private_key(cert, key) == 1;
    if (!matches) ERR_clear_error();
    return matches;
}

} // namespace certmgr::pki
