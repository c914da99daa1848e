/**
 * @file create_request.cpp
 * @brief Variant helpers and JSON parsing for creation requests
 */

#include "create_request.h"
#include "exceptions.h"

#include <type_traits>

namespace domain {
namespace models {

namespace {

constexpr const char* kRequired = "This field is required";

/**
 * @brief Reads typed attributes from a JSON request, recording missing or
 *        mistyped required ones against "<schema>.<attribute>"
 */
class FieldReader {
public:
    FieldReader(const Json::Value& json, std::string schema)
        : json_(json), schema_(std::move(schema)) {}

    std::optional<std::string> optString(const char* key) {
        const Json::Value& v = json_[key];
        if (v.isNull()) return std::nullopt;
        if (!v.isString()) {
            errors_.add(field(key), "Not a string");
            return std::nullopt;
        }
        return v.asString();
    }

    std::string reqString(const char* key) {
        auto v = optString(key);
        if (!v || v->empty()) {
            if (!errors_.contains(field(key))) errors_.add(field(key), kRequired);
            return "";
        }
        return *v;
    }

    std::optional<int64_t> optInt(const char* key) {
        const Json::Value& v = json_[key];
        if (v.isNull()) return std::nullopt;
        if (v.isIntegral()) return v.asInt64();
        if (v.isString()) {
            try {
                size_t pos = 0;
                int64_t parsed = std::stoll(v.asString(), &pos);
                if (pos == v.asString().size()) return parsed;
            } catch (const std::exception&) {
                // reported below
            }
        }
        errors_.add(field(key), "Not an integer");
        return std::nullopt;
    }

    int64_t reqInt(const char* key) {
        auto v = optInt(key);
        if (!v) {
            if (!errors_.contains(field(key))) errors_.add(field(key), kRequired);
            return 0;
        }
        return *v;
    }

    /// Digest name, one of SHA1/SHA224/SHA256/SHA384/SHA512
    std::string reqDigest(const char* key) {
        static const char* const choices[] = {"SHA1", "SHA224", "SHA256", "SHA384", "SHA512"};
        std::string value = reqString(key);
        if (value.empty()) return value;
        for (const char* choice : choices) {
            if (value == choice) return value;
        }
        errors_.add(field(key), "Invalid choice: " + value);
        return value;
    }

    bool optBool(const char* key, bool defaultValue) {
        const Json::Value& v = json_[key];
        if (v.isNull()) return defaultValue;
        if (!v.isBool()) {
            errors_.add(field(key), "Not a boolean");
            return defaultValue;
        }
        return v.asBool();
    }

    std::vector<std::string> stringList(const char* key) {
        std::vector<std::string> values;
        const Json::Value& v = json_[key];
        if (v.isNull()) return values;
        if (!v.isArray()) {
            errors_.add(field(key), "Not a list");
            return values;
        }
        for (const auto& item : v) {
            if (item.isString()) values.push_back(item.asString());
            else errors_.add(field(key), "Not a string");
        }
        return values;
    }

    std::map<std::string, int64_t> idMapping(const char* key) {
        std::map<std::string, int64_t> mapping;
        const Json::Value& v = json_[key];
        if (v.isNull()) return mapping;
        if (!v.isObject()) {
            errors_.add(field(key), "Not an object");
            return mapping;
        }
        for (const auto& member : v.getMemberNames()) {
            const Json::Value& id = v[member];
            if (id.isIntegral()) {
                mapping[member] = id.asInt64();
            } else if (id.isString()) {
                try {
                    mapping[member] = std::stoll(id.asString());
                } catch (const std::exception&) {
                    errors_.add(field(key), "Authenticator id for " + member + " is not an integer");
                }
            } else {
                errors_.add(field(key), "Authenticator id for " + member + " is not an integer");
            }
        }
        return mapping;
    }

    /// Subject attributes; all but OU and SAN required when @p required
    SubjectRequest subject(bool required) {
        SubjectRequest s;
        auto read = [&](const char* key) {
            return required ? std::optional<std::string>(reqString(key)) : optString(key);
        };
        s.country = read("country");
        s.state = read("state");
        s.city = read("city");
        s.organization = read("organization");
        s.organizationalUnit = optString("organizational_unit");
        s.common = read("common");
        s.email = read("email");
        s.san = stringList("san");
        return s;
    }

    void addError(const std::string& key, const std::string& message) {
        errors_.add(field(key), message);
    }

    void throwIfAny() const { errors_.throwIfAny(); }

private:
    std::string field(const std::string& key) const { return schema_ + "." + key; }

    const Json::Value& json_;
    std::string schema_;
    common::ValidationErrors errors_;
};

template <typename T>
void copySubjectCommon(CommonAttributes& attrs, const T& request) {
    attrs.country = request.subject.country;
    attrs.keyLength = request.keyLength;
    attrs.digestAlgorithm = request.digestAlgorithm;
}

} // anonymous namespace

// ============================================================================
// Variant helpers
// ============================================================================

CommonAttributes commonAttributes(const CertificateCreateRequest& request) {
    CommonAttributes attrs;
    std::visit([&attrs](const auto& r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, CreateInternalCertificate>) {
            copySubjectCommon(attrs, r);
            attrs.signedby = r.signedby;
        } else if constexpr (std::is_same_v<T, ImportCertificate>) {
            attrs.certificate = r.certificate;
            attrs.privatekey = r.privatekey;
            attrs.passphrase = r.passphrase;
            attrs.csrId = r.csrId;
        } else if constexpr (std::is_same_v<T, CreateCsr>) {
            copySubjectCommon(attrs, r);
        } else if constexpr (std::is_same_v<T, ImportCsr>) {
            attrs.csr = r.csr;
            attrs.privatekey = r.privatekey;
            attrs.passphrase = r.passphrase;
        } else if constexpr (std::is_same_v<T, CreateAcmeCertificate>) {
            attrs.csrId = r.csrId;
        } else if constexpr (std::is_same_v<T, CreateFromSignedCertificate>) {
            attrs.certificate = r.certificate;
            attrs.privatekey = r.privatekey;
            attrs.signedby = r.signedby;
        } else {
            static_assert(std::is_void_v<T>, "unhandled certificate request variant");
        }
    }, request);
    return attrs;
}

CommonAttributes commonAttributes(const CaCreateRequest& request) {
    CommonAttributes attrs;
    std::visit([&attrs](const auto& r) {
        using T = std::decay_t<decltype(r)>;
        if constexpr (std::is_same_v<T, CreateInternalCa>) {
            copySubjectCommon(attrs, r);
        } else if constexpr (std::is_same_v<T, ImportCa>) {
            attrs.certificate = r.certificate;
            attrs.privatekey = r.privatekey;
            attrs.passphrase = r.passphrase;
        } else if constexpr (std::is_same_v<T, CreateIntermediateCa>) {
            copySubjectCommon(attrs, r);
            attrs.signedby = r.signedby;
        } else {
            static_assert(std::is_void_v<T>, "unhandled CA request variant");
        }
    }, request);
    return attrs;
}

const std::string& requestName(const CertificateCreateRequest& request) {
    return std::visit([](const auto& r) -> const std::string& { return r.name; }, request);
}

const std::string& requestName(const CaCreateRequest& request) {
    return std::visit([](const auto& r) -> const std::string& { return r.name; }, request);
}

// ============================================================================
// JSON parsing
// ============================================================================

CertificateCreateRequest parseCertificateCreateRequest(const Json::Value& json) {
    FieldReader in(json, "certificate_create");
    std::string createType = in.reqString("create_type");
    std::string name = in.reqString("name");
    in.throwIfAny();

    CertificateCreateRequest request;
    if (createType == "CERTIFICATE_CREATE_INTERNAL") {
        CreateInternalCertificate r;
        r.name = name;
        r.subject = in.subject(true);
        r.keyLength = static_cast<int>(in.reqInt("key_length"));
        r.digestAlgorithm = in.reqDigest("digest_algorithm");
        r.lifetime = static_cast<int>(in.reqInt("lifetime"));
        r.signedby = in.reqInt("signedby");
        request = r;
    } else if (createType == "CERTIFICATE_CREATE_IMPORTED") {
        ImportCertificate r;
        r.name = name;
        r.certificate = in.reqString("certificate");
        r.privatekey = in.optString("privatekey");
        r.passphrase = in.optString("passphrase");
        r.csrId = in.optInt("csr_id");
        request = r;
    } else if (createType == "CERTIFICATE_CREATE_CSR") {
        CreateCsr r;
        r.name = name;
        r.subject = in.subject(true);
        r.keyLength = static_cast<int>(in.reqInt("key_length"));
        r.digestAlgorithm = in.reqDigest("digest_algorithm");
        request = r;
    } else if (createType == "CERTIFICATE_CREATE_IMPORTED_CSR") {
        ImportCsr r;
        r.name = name;
        r.csr = in.reqString("CSR");
        r.privatekey = in.reqString("privatekey");
        r.passphrase = in.optString("passphrase");
        request = r;
    } else if (createType == "CERTIFICATE_CREATE_ACME") {
        CreateAcmeCertificate r;
        r.name = name;
        r.csrId = in.reqInt("csr_id");
        r.acmeDirectoryUri = in.reqString("acme_directory_uri");
        r.dnsMapping = in.idMapping("dns_mapping");
        r.tos = in.optBool("tos", false);
        r.renewDays = static_cast<int>(in.optInt("renew_days").value_or(10));
        if (r.renewDays < 1) {
            in.addError("renew_days", "Should be greater or equal than 1");
        }
        request = r;
    } else if (createType == "CERTIFICATE_CREATE") {
        CreateFromSignedCertificate r;
        r.name = name;
        r.certificate = in.reqString("certificate");
        r.privatekey = in.reqString("privatekey");
        r.type = static_cast<int>(in.reqInt("type"));
        r.signedby = in.optInt("signedby");
        request = r;
    } else {
        in.addError("create_type", "Invalid choice: " + createType);
    }

    in.throwIfAny();
    return request;
}

CaCreateRequest parseCaCreateRequest(const Json::Value& json) {
    FieldReader in(json, "certificate_authority_create");
    std::string createType = in.reqString("create_type");
    std::string name = in.reqString("name");
    in.throwIfAny();

    CaCreateRequest request;
    if (createType == "CA_CREATE_INTERNAL" || createType == "CA_CREATE_INTERMEDIATE") {
        SubjectRequest subject = in.subject(true);
        int keyLength = static_cast<int>(in.reqInt("key_length"));
        std::string digest = in.reqDigest("digest_algorithm");
        int lifetime = static_cast<int>(in.reqInt("lifetime"));

        if (createType == "CA_CREATE_INTERNAL") {
            request = CreateInternalCa{name, subject, keyLength, digest, lifetime};
        } else {
            request = CreateIntermediateCa{name, subject, keyLength, digest, lifetime,
                                           in.reqInt("signedby")};
        }
    } else if (createType == "CA_CREATE_IMPORTED") {
        ImportCa r;
        r.name = name;
        r.certificate = in.reqString("certificate");
        r.privatekey = in.optString("privatekey");
        r.passphrase = in.optString("passphrase");
        request = r;
    } else {
        in.addError("create_type", "Invalid choice: " + createType);
    }

    in.throwIfAny();
    return request;
}

CaSignCsrRequest parseCaSignCsrRequest(const Json::Value& json) {
    FieldReader in(json, "ca_sign_csr");
    CaSignCsrRequest request;
    request.caId = in.reqInt("ca_id");
    request.csrCertId = in.reqInt("csr_cert_id");
    request.name = in.reqString("name");
    in.throwIfAny();
    return request;
}

CaUpdateRequest parseCaUpdateRequest(const Json::Value& json) {
    FieldReader in(json, "certificate_authority_update");
    CaUpdateRequest request;
    request.name = in.optString("name");
    request.createType = in.optString("create_type");
    request.csrCertId = in.optInt("csr_cert_id");
    if (request.createType && *request.createType != "CA_SIGN_CSR") {
        in.addError("create_type", "Invalid choice: " + *request.createType);
    }
    in.throwIfAny();
    return request;
}

} // namespace models
} // namespace domain
