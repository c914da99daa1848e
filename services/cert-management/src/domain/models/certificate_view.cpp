#include "certificate_view.h"

namespace domain {
namespace models {

namespace {

Json::Value optionalString(const std::optional<std::string>& value) {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

Json::Value optionalInt(const std::optional<int64_t>& value) {
    return value ? Json::Value(static_cast<Json::Int64>(*value)) : Json::Value(Json::nullValue);
}

Json::Value optionalInt(const std::optional<int>& value) {
    return value ? Json::Value(*value) : Json::Value(Json::nullValue);
}

struct IssuerToJson {
    Json::Value operator()(const ExternalIssuer&) const { return kIssuerExternal; }
    Json::Value operator()(const SelfSignedIssuer&) const { return kIssuerSelfSigned; }
    Json::Value operator()(const PendingSignatureIssuer&) const { return kIssuerPendingSignature; }
    Json::Value operator()(const SignedByIssuer& signedBy) const {
        return signedBy.parent ? signedBy.parent->toJson() : Json::Value(Json::nullValue);
    }
};

} // anonymous namespace

const CertificateView* CertificateView::signingAuthority() const {
    if (!issuer) return nullptr;
    const auto* signedBy = std::get_if<SignedByIssuer>(&*issuer);
    return signedBy ? signedBy->parent.get() : nullptr;
}

Json::Value CertificateView::toJson() const {
    Json::Value json(Json::objectValue);
    json["id"] = static_cast<Json::Int64>(record.id);
    json["name"] = record.name;
    json["type"] = record.type;
    json["certificate"] = optionalString(record.certificate);
    json["privatekey"] = optionalString(record.privatekey);
    json["CSR"] = optionalString(record.csr);
    json["serial"] = optionalInt(record.serial);
    json["signedby"] = optionalInt(record.signedby);

    json["country"] = optionalString(record.country);
    json["state"] = optionalString(record.state);
    json["city"] = optionalString(record.city);
    json["organization"] = optionalString(record.organization);
    json["organizational_unit"] = optionalString(record.organizationalUnit);
    json["common"] = optionalString(record.common);
    json["email"] = optionalString(record.email);
    json["key_length"] = optionalInt(record.keyLength);
    json["digest_algorithm"] = optionalString(record.digestAlgorithm);
    json["lifetime"] = optionalInt(record.lifetime);
    json["chain"] = record.chain;

    Json::Value sanJson(Json::arrayValue);
    for (const auto& s : san) sanJson.append(s);
    json["san"] = sanJson;

    json["issuer"] = issuer ? std::visit(IssuerToJson{}, *issuer) : Json::Value(Json::nullValue);

    json["root_path"] = rootPath;
    json["certificate_path"] = certificatePath;
    json["privatekey_path"] = privatekeyPath;
    json["csr_path"] = csrPath;

    Json::Value chainJson(Json::arrayValue);
    for (const auto& pem : chainList) chainJson.append(pem);
    json["chain_list"] = chainJson;

    json["from"] = optionalString(from);
    json["until"] = optionalString(until);
    if (dn) json["DN"] = *dn;
    json["internal"] = internal ? "YES" : "NO";

    if (record.isAcme()) {
        json["acme"] = static_cast<Json::Int64>(*record.acme);
        json["acme_uri"] = optionalString(record.acmeUri);
        Json::Value mapping(Json::objectValue);
        for (const auto& [domain, authId] : record.domainsAuthenticators) {
            mapping[domain] = static_cast<Json::Int64>(authId);
        }
        json["domains_authenticators"] = mapping;
        json["renew_days"] = optionalInt(record.renewDays);
    }
    return json;
}

} // namespace models
} // namespace domain
