// ./wnibe_bench ../params/a.param
#include <chrono>
#include <cstdio>
#include <memory>
#include <stdexcept>

#include "WNIBE.hpp"

#define ITERCNT 10

using namespace wnibe;

static long long now_us()
{
    return std::chrono::duration_cast<std::chrono::microseconds>(
               std::chrono::high_resolution_clock::now().time_since_epoch())
        .count();
}

int main(int argc, char *argv[])
{
    try
    {
        std::unique_ptr<Pairing> pairing(argc > 1 ? new Pairing(argc, argv) : new Pairing());
        WNIBE ibe(*pairing);
        OsRng rng;

        Identity kid = Identity::deriveStr(*pairing, "email:w.geraedts@sarif.nl");

        long long tSetup = 0, tExtract = 0, tEncrypt = 0, tDecrypt = 0;
        for (int i = 0; i < ITERCNT; i++)
        {
            Message m = Message::generate(*pairing, rng);

            long long t0 = now_us();
            std::pair<PublicKey, SecretKey> keys = ibe.Setup(rng);
            long long t1 = now_us();
            UserSecretKey usk = ibe.Extract(keys.first, keys.second, kid, rng);
            long long t2 = now_us();
            CipherText c = ibe.Encrypt(keys.first, kid, m, rng);
            long long t3 = now_us();
            Message m2 = ibe.Decrypt(usk, c);
            long long t4 = now_us();

            if (m != m2)
            {
                printf("Decryption phase : verification fails\n");
                return 1;
            }

            tSetup += t1 - t0;
            tExtract += t2 - t1;
            tEncrypt += t3 - t2;
            tDecrypt += t4 - t3;
        }

        printf("symmetric pairing : %s\n", pairing->isSymmetric() ? "yes" : "no");
        printf("setup   : %lld us\n", tSetup / ITERCNT);
        printf("extract : %lld us\n", tExtract / ITERCNT);
        printf("encrypt : %lld us\n", tEncrypt / ITERCNT);
        printf("decrypt : %lld us\n", tDecrypt / ITERCNT);

        printf("public key      : %zu bytes\n", PublicKey::byteSize(*pairing));
        printf("secret key      : %zu bytes\n", SecretKey::byteSize(*pairing));
        printf("user secret key : %zu bytes\n", UserSecretKey::byteSize(*pairing));
        printf("ciphertext      : %zu bytes\n", CipherText::byteSize(*pairing));
        printf("message         : %zu bytes\n", Message::byteSize(*pairing));
    }
    catch (const std::exception &e)
    {
        std::fprintf(stderr, "bench failed: %s\n", e.what());
        return 1;
    }

    return 0;
}
