#include "veilrelay/version.hpp"
#include "veilrelay/sdk/HttpClient.hpp"
#include "veilrelay/sdk/Json.hpp"
#include "veilrelay/sdk/Keypair.hpp"
#include "veilrelay/sdk/SecureLogger.hpp"
#include "veilrelay/sdk/SolanaRpcClient.hpp"
#include "veilrelay/sdk/ThreadPool.hpp"
#include "veilrelay/relay/JupiterRouter.hpp"
#include "veilrelay/relay/ProofJobManager.hpp"
#include "veilrelay/relay/RaydiumRouter.hpp"
#include "veilrelay/relay/RelayConfig.hpp"
#include "veilrelay/relay/RelaySigner.hpp"
#include "veilrelay/relay/SwapOrchestrator.hpp"
#include "veilrelay/relay/TokenAccountResolver.hpp"
#include <atomic>
#include <csignal>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <map>
#include <string>
#include <thread>
#include <getopt.h>
#include <sys/resource.h>

using namespace veilrelay;
using namespace veilrelay::sdk;
using namespace veilrelay::relay;

namespace json = veilrelay::sdk::json;

// Cleared by SIGINT / SIGTERM
std::atomic<bool> running(true);

const std::string BUILD_DATE = __DATE__ " " __TIME__;

struct CommandLineOptions {
    std::string config_file;
    std::map<std::string, std::string> overrides;   // config keys set on the command line

    bool info = false;
    bool tokens = false;
    bool quote = false;
    bool withdraw = false;

    std::string commitment;
    std::string secret;
    std::string amount;
    std::string denomination = "0";
    std::string recipient;
    std::string output_mint;
    std::string slippage;

    bool version = false;
    bool help = false;
    bool invalid = false;
};

/**
 * @brief Services wired together for one run, in dependency order
 */
struct Services {
    std::shared_ptr<HttpClient> http;
    std::shared_ptr<SolanaRpcClient> rpc;
    std::shared_ptr<Keypair> keypair;
    std::shared_ptr<RelaySigner> signer;
    std::shared_ptr<SwapRouter> router;
    std::shared_ptr<ThreadPool> pool;
    std::shared_ptr<ProofJobManager> jobs;
    std::shared_ptr<TokenAccountResolver> resolver;
    std::shared_ptr<SwapOrchestrator> orchestrator;
};

void signal_handler(int) {
    running = false;
}

// Keep key material out of core files
void setup_security() {
    struct rlimit limit;
    limit.rlim_cur = 0;
    limit.rlim_max = 0;
    if (setrlimit(RLIMIT_CORE, &limit) != 0) {
        SecureLogger::instance().warning("Failed to disable core dumps: " + std::string(strerror(errno)));
    }
}

CommandLineOptions parse_args(int argc, char* argv[]) {
    CommandLineOptions options;

    enum LongOnly {
        OPT_PROVER_URL = 256,
        OPT_LOG_PATH,
        OPT_COMMITMENT,
        OPT_SECRET,
        OPT_DENOMINATION,
        OPT_RECIPIENT,
        OPT_OUTPUT_MINT,
        OPT_SLIPPAGE
    };

    static struct option long_options[] = {
        {"config", required_argument, 0, 'c'},
        {"rpc-url", required_argument, 0, 'r'},
        {"keypair", required_argument, 0, 'k'},
        {"provider", required_argument, 0, 'p'},
        {"prover-url", required_argument, 0, OPT_PROVER_URL},
        {"log-level", required_argument, 0, 'l'},
        {"log-path", required_argument, 0, OPT_LOG_PATH},
        {"info", no_argument, 0, 'i'},
        {"tokens", no_argument, 0, 't'},
        {"quote", no_argument, 0, 'q'},
        {"withdraw", no_argument, 0, 'w'},
        {"commitment", required_argument, 0, OPT_COMMITMENT},
        {"secret", required_argument, 0, OPT_SECRET},
        {"amount", required_argument, 0, 'a'},
        {"denomination", required_argument, 0, OPT_DENOMINATION},
        {"recipient", required_argument, 0, OPT_RECIPIENT},
        {"output-mint", required_argument, 0, OPT_OUTPUT_MINT},
        {"slippage-bps", required_argument, 0, OPT_SLIPPAGE},
        {"version", no_argument, 0, 'v'},
        {"help", no_argument, 0, 'h'},
        {0, 0, 0, 0}
    };

    int opt;
    int option_index = 0;

    while ((opt = getopt_long(argc, argv, "c:r:k:p:l:itqwa:vh", long_options, &option_index)) != -1) {
        switch (opt) {
            case 'c':
                options.config_file = optarg;
                break;
            case 'r':
                options.overrides["rpc_url"] = optarg;
                break;
            case 'k':
                options.overrides["keypair_path"] = optarg;
                break;
            case 'p':
                options.overrides["provider"] = optarg;
                break;
            case OPT_PROVER_URL:
                options.overrides["prover_url"] = optarg;
                break;
            case 'l':
                options.overrides["log_level"] = optarg;
                break;
            case OPT_LOG_PATH:
                options.overrides["log_path"] = optarg;
                break;
            case 'i':
                options.info = true;
                break;
            case 't':
                options.tokens = true;
                break;
            case 'q':
                options.quote = true;
                break;
            case 'w':
                options.withdraw = true;
                break;
            case OPT_COMMITMENT:
                options.commitment = optarg;
                break;
            case OPT_SECRET:
                options.secret = optarg;
                break;
            case 'a':
                options.amount = optarg;
                break;
            case OPT_DENOMINATION:
                options.denomination = optarg;
                break;
            case OPT_RECIPIENT:
                options.recipient = optarg;
                break;
            case OPT_OUTPUT_MINT:
                options.output_mint = optarg;
                break;
            case OPT_SLIPPAGE:
                options.slippage = optarg;
                break;
            case 'v':
                options.version = true;
                break;
            case 'h':
                options.help = true;
                break;
            default:
                options.invalid = true;
                break;
        }
    }

    return options;
}

void print_usage(const char* program_name) {
    std::cout << Version::name << " " << Version::str << " (" << BUILD_DATE << ")" << std::endl;
    std::cout << "Usage: " << program_name << " [options] ACTION" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "  -c, --config=FILE        Configuration file path" << std::endl;
    std::cout << "  -r, --rpc-url=URL        Solana RPC endpoint" << std::endl;
    std::cout << "  -k, --keypair=FILE       Relayer keypair file (JSON array of 64 bytes)" << std::endl;
    std::cout << "  -p, --provider=NAME      Swap provider (jupiter, raydium)" << std::endl;
    std::cout << "      --prover-url=URL     Proof generation service" << std::endl;
    std::cout << "  -l, --log-level=LEVEL    Log level (trace, debug, info, warning, error, critical)" << std::endl;
    std::cout << "      --log-path=DIR       Log directory" << std::endl;
    std::cout << "Actions:" << std::endl;
    std::cout << "  -i, --info               Print relayer key, fee and balance" << std::endl;
    std::cout << "  -t, --tokens             Print the provider's token list" << std::endl;
    std::cout << "  -q, --quote              Quote --amount lamports into --output-mint" << std::endl;
    std::cout << "  -w, --withdraw           Prove, unshield and swap a deposit" << std::endl;
    std::cout << "Withdrawal parameters:" << std::endl;
    std::cout << "      --commitment=HEX     Deposit commitment" << std::endl;
    std::cout << "      --secret=HEX         Deposit secret" << std::endl;
    std::cout << "  -a, --amount=LAMPORTS    Amount to withdraw or quote" << std::endl;
    std::cout << "      --denomination=N     Pool denomination in lamports (0 for custom)" << std::endl;
    std::cout << "      --recipient=ADDR     Recipient wallet" << std::endl;
    std::cout << "      --output-mint=ADDR   Token to receive" << std::endl;
    std::cout << "      --slippage-bps=N     Slippage tolerance" << std::endl;
    std::cout << "  -v, --version            Print version information and exit" << std::endl;
    std::cout << "  -h, --help               Print this help message and exit" << std::endl;
}

void print_version() {
    std::cout << Version::name << " " << Version::str << " (" << BUILD_DATE << ")" << std::endl;
    std::cout << "Private withdrawal relay with swap routing" << std::endl;
}

bool parse_u64(const std::string& text, uint64_t& out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        out = std::stoull(text);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

int report_error(const std::string& what, ErrorCode code, const std::string& message) {
    std::cerr << what << ": " << message << " (status " << recommended_status(code) << ")" << std::endl;
    SecureLogger::instance().error(what + ": " + message);
    return EXIT_FAILURE;
}

Result<RelayConfig> load_configuration(const CommandLineOptions& options) {
    RelayConfig config;

    std::string path = options.config_file.empty() ? RelayConfig::find_default_path() : options.config_file;
    if (!path.empty()) {
        auto loaded = RelayConfig::load(path);
        if (loaded.is_err()) {
            return loaded;
        }
        config = loaded.value();
    }

    for (const auto& entry : options.overrides) {
        auto applied = config.set(entry.first, entry.second);
        if (applied.is_err()) {
            return {applied.error(), applied.error_message()};
        }
    }

    auto valid = config.validate();
    if (valid.is_err()) {
        return {valid.error(), valid.error_message()};
    }
    return config;
}

void init_logger(const RelayConfig& config) {
    std::error_code ec;
    std::filesystem::create_directories(config.log_path, ec);
    if (ec) {
        std::cerr << "Cannot create log directory " << config.log_path << ": " << ec.message() << std::endl;
    }
    SecureLogger::instance().initialize(config.log_path, SecureLogger::parse_level(config.log_level));
}

std::shared_ptr<SwapRouter> make_router(const RelayConfig& config, std::shared_ptr<HttpTransport> transport) {
    if (config.provider == "jupiter") {
        JupiterRouter::Config router_config;
        router_config.api_url = config.jupiter_api_url;
        router_config.token_list_url = config.jupiter_token_list_url;
        return std::make_shared<JupiterRouter>(router_config, std::move(transport));
    }

    RaydiumRouter::Config router_config;
    router_config.api_url = config.raydium_api_url;
    router_config.pools_api_url = config.raydium_pools_api_url;
    return std::make_shared<RaydiumRouter>(router_config, std::move(transport));
}

Result<Services> build_services(const RelayConfig& config) {
    Services services;

    auto crypto = initialize_crypto();
    if (crypto.is_err()) {
        return {crypto.error(), crypto.error_message()};
    }

    auto keypair = Keypair::load_file(config.keypair_path);
    if (keypair.is_err()) {
        return {keypair.error(), keypair.error_message()};
    }
    services.keypair = keypair.value();

    services.http = std::make_shared<HttpClient>();
    services.rpc = std::make_shared<SolanaRpcClient>(config.rpc_url, services.http);

    RelaySigner::Config signer_config;
    signer_config.enabled = config.relayer_enabled;
    signer_config.fee_bps = config.fee_bps;
    signer_config.min_fee = config.min_fee;
    signer_config.program_id = config.program_id;
    services.signer = std::make_shared<RelaySigner>(services.keypair, services.rpc, signer_config);

    services.router = make_router(config, services.http);
    services.pool = std::make_shared<ThreadPool>(config.worker_threads);
    services.jobs = std::make_shared<ProofJobManager>(
        std::make_shared<RemoteProverClient>(config.prover_url, services.http), services.pool);
    services.resolver = std::make_shared<TokenAccountResolver>(services.rpc, services.signer);

    SwapOrchestrator::Options saga_options;
    saga_options.default_slippage_bps = config.default_slippage_bps;
    services.orchestrator = std::make_shared<SwapOrchestrator>(services.jobs, services.signer, services.router,
                                                               services.resolver, services.rpc, saga_options);
    return services;
}

int run_info(Services& services) {
    RelayerInfo info = services.signer->info();
    std::cout << "{\"enabled\":" << (info.enabled ? "true" : "false")
              << ",\"publicKey\":" << json::quote(info.public_key)
              << ",\"feeBps\":" << info.fee_bps
              << ",\"balance\":" << info.balance
              << ",\"provider\":" << json::quote(services.router->name()) << "}" << std::endl;
    return EXIT_SUCCESS;
}

int run_tokens(Services& services) {
    auto tokens = services.router->get_token_list();
    if (tokens.is_err()) {
        return report_error("Token list failed", tokens.error(), tokens.error_message());
    }

    std::cout << "[";
    bool first = true;
    for (const auto& token : tokens.value()) {
        std::cout << (first ? "" : ",")
                  << "{\"address\":" << json::quote(token.address)
                  << ",\"symbol\":" << json::quote(token.symbol)
                  << ",\"name\":" << json::quote(token.name)
                  << ",\"decimals\":" << static_cast<int>(token.decimals);
        if (token.logo_uri) {
            std::cout << ",\"logoURI\":" << json::quote(*token.logo_uri);
        }
        std::cout << "}";
        first = false;
    }
    std::cout << "]" << std::endl;
    return EXIT_SUCCESS;
}

int run_quote(Services& services, const CommandLineOptions& options, uint32_t slippage) {
    uint64_t amount = 0;
    if (!parse_u64(options.amount, amount) || amount == 0) {
        return report_error("Quote failed", ErrorCode::INVALID_PARAMETER, "--amount must be a positive integer");
    }
    if (options.output_mint.empty()) {
        return report_error("Quote failed", ErrorCode::INVALID_PARAMETER, "--output-mint is required");
    }

    auto quote = services.router->get_quote(constants::WRAPPED_SOL_MINT, options.output_mint, amount, slippage);
    if (quote.is_err()) {
        return report_error("Quote failed", quote.error(), quote.error_message());
    }

    const Quote& q = quote.value();
    std::cout << "{\"inputMint\":" << json::quote(q.input_mint)
              << ",\"outputMint\":" << json::quote(q.output_mint)
              << ",\"inAmount\":" << json::quote(std::to_string(q.in_amount))
              << ",\"outAmount\":" << json::quote(std::to_string(q.out_amount))
              << ",\"minimumReceived\":" << json::quote(std::to_string(q.other_amount_threshold))
              << ",\"slippageBps\":" << q.slippage_bps
              << ",\"priceImpactPct\":" << json::quote(q.price_impact_pct)
              << ",\"provider\":" << json::quote(q.provider) << "}" << std::endl;
    return EXIT_SUCCESS;
}

int run_withdraw(Services& services, const CommandLineOptions& options, std::optional<uint32_t> slippage) {
    ProofJobParams params;
    params.commitment = options.commitment;
    params.secret = options.secret;
    params.recipient = options.recipient;

    if (!parse_u64(options.amount, params.amount)) {
        return report_error("Withdrawal failed", ErrorCode::INVALID_PARAMETER, "--amount must be an integer");
    }
    if (!parse_u64(options.denomination, params.denomination)) {
        return report_error("Withdrawal failed", ErrorCode::INVALID_PARAMETER, "--denomination must be an integer");
    }
    if (options.output_mint.empty()) {
        return report_error("Withdrawal failed", ErrorCode::INVALID_PARAMETER, "--output-mint is required");
    }

    auto job_id = services.jobs->submit(params);
    if (job_id.is_err()) {
        return report_error("Withdrawal failed", job_id.error(), job_id.error_message());
    }
    std::cerr << "Proof job " << job_id.value() << " submitted" << std::endl;

    int last_progress = -1;
    std::optional<ProofJob> job;
    while (running) {
        job = services.jobs->get_status(job_id.value());
        if (!job) {
            return report_error("Withdrawal failed", ErrorCode::JOB_NOT_FOUND, "Job disappeared: " + job_id.value());
        }
        if (job->progress != last_progress) {
            last_progress = job->progress;
            std::cerr << "  " << job->progress << "% " << job->stage << std::endl;
        }
        if (job->is_terminal()) {
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (!running) {
        std::cerr << "Interrupted before the proof completed, nothing was submitted" << std::endl;
        return EXIT_FAILURE;
    }
    if (job->status == JobStatus::FAILED) {
        return report_error("Proof generation failed", ErrorCode::PROOF_GENERATION_FAILED, job->error.value_or(""));
    }

    SwapRequest request;
    request.job_id = job_id.value();
    request.recipient = options.recipient;
    request.output_mint = options.output_mint;
    request.slippage_bps = slippage;

    auto outcome = services.orchestrator->execute(request);
    if (outcome.is_err()) {
        return report_error("Swap failed", outcome.error(), outcome.error_message());
    }

    const SwapOutcome& o = outcome.value();
    std::cout << "{\"unshieldSignature\":" << json::quote(o.unshield_signature)
              << ",\"swapSignature\":" << json::quote(o.swap_signature)
              << ",\"transferSignature\":" << json::quote(o.transfer_signature)
              << ",\"outputAmount\":" << json::quote(o.output_amount)
              << ",\"outputMint\":" << json::quote(o.output_mint)
              << ",\"recipient\":" << json::quote(o.recipient)
              << ",\"fee\":" << o.fee << "}" << std::endl;
    return EXIT_SUCCESS;
}

int main(int argc, char* argv[]) {
    try {
        CommandLineOptions options = parse_args(argc, argv);

        if (options.version) {
            print_version();
            return EXIT_SUCCESS;
        }

        const int actions = options.info + options.tokens + options.quote + options.withdraw;
        if (options.help || options.invalid || actions != 1) {
            print_usage(argv[0]);
            return options.help ? EXIT_SUCCESS : EXIT_FAILURE;
        }

        auto config = load_configuration(options);
        if (config.is_err()) {
            std::cerr << "Configuration error: " << config.error_message() << std::endl;
            return EXIT_FAILURE;
        }

        init_logger(config.value());
        SecureLogger::instance().info(std::string(Version::name) + " " + Version::str + " starting, provider " +
                                      config.value().provider + ", rpc " + config.value().rpc_url);

        setup_security();

        signal(SIGINT, signal_handler);
        signal(SIGTERM, signal_handler);

        std::optional<uint32_t> slippage;
        if (!options.slippage.empty()) {
            uint64_t parsed = 0;
            if (!parse_u64(options.slippage, parsed) || parsed > 10000) {
                std::cerr << "--slippage-bps must be between 0 and 10000" << std::endl;
                return EXIT_FAILURE;
            }
            slippage = static_cast<uint32_t>(parsed);
        }

        auto services = build_services(config.value());
        if (services.is_err()) {
            SecureLogger::instance().critical("Failed to initialize services: " + services.error_message());
            std::cerr << "Initialization failed: " << services.error_message() << std::endl;
            return EXIT_FAILURE;
        }

        int status = EXIT_SUCCESS;
        if (options.info) {
            status = run_info(services.value());
        } else if (options.tokens) {
            status = run_tokens(services.value());
        } else if (options.quote) {
            status = run_quote(services.value(), options,
                               slippage.value_or(config.value().default_slippage_bps));
        } else {
            services.value().jobs->start();
            status = run_withdraw(services.value(), options, slippage);
            services.value().jobs->stop();
        }

        services.value().pool->shutdown();
        SecureLogger::instance().info(std::string(Version::name) + " finished with status " + std::to_string(status));
        SecureLogger::instance().flush();
        return status;

    } catch (const std::exception& e) {
        std::cerr << "Fatal exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }
}
