// sign_metadata.cpp
// Stamps a model metadata file with the model digest and a signature
// Usage: signrec_sign <metadata.json> [model.tflite]
// With SIGNREC_SECRET set the signature is HMAC-SHA256, otherwise plain SHA256.

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <string>
#include <nlohmann/json.hpp>
#include "../include/crypto.hpp"
#include "../include/label_set.hpp"

int main(int argc, char **argv)
{
    if (argc < 2 || argc > 3)
    {
        std::cerr << "Usage: signrec_sign <metadata.json> [model.tflite]\n";
        return 2;
    }
    std::string path = argv[1];

    std::ifstream in(path);
    if (!in.is_open())
    {
        std::cerr << "Failed to open " << path << " for reading\n";
        return 2;
    }
    nlohmann::json j;
    try {
        in >> j;
    } catch (const std::exception &e) {
        std::cerr << "JSON parse error: " << e.what() << "\n";
        return 2;
    }
    in.close();

    if (!j.is_object() || !j.contains("classes"))
    {
        std::cerr << path << " is not a model metadata file (no \"classes\")\n";
        return 2;
    }

    if (argc == 3)
    {
        std::string digest = signrec::crypto::sha256_file_hex(argv[2]);
        if (digest.empty())
        {
            std::cerr << "Failed to read model " << argv[2] << "\n";
            return 2;
        }
        j["modelSha256"] = digest;
    }

    const char *secret_env = std::getenv("SIGNREC_SECRET");
    std::string secret = (secret_env && *secret_env) ? secret_env : "";
    std::string sig = signrec::metadata_signature(j.dump(), secret);
    if (sig.empty())
    {
        std::cerr << "Failed to compute signature\n";
        return 2;
    }
    j["signature"] = sig;

    // Write to a temp file then rename
    std::string tmp = path + ".tmp";
    std::ofstream out(tmp, std::ios::trunc);
    if (!out.is_open())
    {
        std::cerr << "Failed to open temp file for writing: " << tmp << "\n";
        return 2;
    }
    out << j.dump(2) << "\n";
    out.close();
    if (!out)
    {
        std::cerr << "Failed to write " << tmp << "\n";
        std::remove(tmp.c_str());
        return 2;
    }

    if (std::rename(tmp.c_str(), path.c_str()) != 0)
    {
        std::perror("rename");
        std::remove(tmp.c_str());
        return 2;
    }

    std::cout << "Signed " << path << (secret.empty() ? " (sha256)" : " (hmac-sha256)") << "\n";
    if (j.contains("modelSha256"))
        std::cout << "Model digest: " << j["modelSha256"].get<std::string>() << "\n";
    std::cout << "Signature: " << sig << "\n";
    return 0;
}
