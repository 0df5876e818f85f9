#include "nimbridge.h"
#include "config.h"
#include "http_client.h"
#include "upstream.h"
#include "server/api_server.h"

#include <cstring>
#include <cstdlib>
#include <getopt.h>
#include <csignal>
#include <pthread.h>
#include <thread>

// Global debug level (0=off, 1-9=increasing verbosity)
// Used by dprintf() macro in debug.h for fine-grained debug control
int g_debug_level = 0;

static void print_usage(int, char** argv) {
	printf("\n=== nimbridge - chat-completion protocol transcoder ===\n");
	printf("\nUsage:\n");
	printf("	%s [OPTIONS]\n", argv[0]);
	printf("\nOptions:\n");
	printf("	-c, --config FILE	  Config file (default: ~/.config/nimbridge/config.json)\n");
	printf("	-d, --debug[=N]		  Enable debug logging with optional level (1-9, default: 1)\n");
	printf("	-l, --log-file FILE	  Also log to FILE\n");
	printf("	--api-base URL		  Upstream base URL (overrides config and NIM_API_BASE)\n");
	printf("	--api-key KEY		  Upstream API key (overrides config and NIM_API_KEY)\n");
	printf("	--host HOST		  Address to bind to (default: 0.0.0.0)\n");
	printf("	--port PORT		  Port to listen on (default: 3000 or $PORT)\n");
	printf("	--token-budget N	  History token budget (default: 8000)\n");
	printf("	--timeout SECONDS	  Upstream call timeout, 0 = none (default: 600)\n");
	printf("	--show-reasoning	  Forward upstream reasoning_content to clients\n");
	printf("	--no-thinking		  Do not request deep reasoning from the upstream\n");
	printf("	-v, --version		  Show version information\n");
	printf("	-h, --help		  Show this help message\n");
	printf("\n");
}

int main(int argc, char** argv) {
	std::string config_file_path;
	std::string log_file;

	// Command-line overrides (applied after config file and environment)
	struct {
		std::string api_base;
		std::string api_key;
		std::string host;
		int port = 0;
		int token_budget = 0;
		long timeout = -1;
		bool show_reasoning = false;
		bool no_thinking = false;
	} cli;

	static struct option long_options[] = {
		{"config", required_argument, 0, 'c'},
		{"debug", optional_argument, 0, 'd'},
		{"log-file", required_argument, 0, 'l'},
		{"api-base", required_argument, 0, 1001},
		{"api-key", required_argument, 0, 1002},
		{"host", required_argument, 0, 1003},
		{"port", required_argument, 0, 1004},
		{"token-budget", required_argument, 0, 1005},
		{"timeout", required_argument, 0, 1006},
		{"show-reasoning", no_argument, 0, 1007},
		{"no-thinking", no_argument, 0, 1008},
		{"version", no_argument, 0, 'v'},
		{"help", no_argument, 0, 'h'},
		{0, 0, 0, 0}
	};

	int opt;
	int option_index = 0;
	while ((opt = getopt_long(argc, argv, "c:d::l:vh", long_options, &option_index)) != -1) {
		switch (opt) {
			case 'c':
				config_file_path = optarg;
				break;
			case 'd':
				g_debug_level = optarg ? atoi(optarg) : 1;
				if (g_debug_level < 1) g_debug_level = 1;
				break;
			case 'l':
				log_file = optarg;
				break;
			case 1001: // --api-base
				cli.api_base = optarg;
				break;
			case 1002: // --api-key
				cli.api_key = optarg;
				break;
			case 1003: // --host
				cli.host = optarg;
				break;
			case 1004: // --port
				cli.port = std::atoi(optarg);
				if (cli.port <= 0 || cli.port > 65535) {
					printf("Error: port must be between 1 and 65535\n");
					return 1;
				}
				break;
			case 1005: // --token-budget
				cli.token_budget = std::atoi(optarg);
				if (cli.token_budget <= 0) {
					printf("Error: token-budget must be positive\n");
					return 1;
				}
				break;
			case 1006: // --timeout
				cli.timeout = std::atol(optarg);
				if (cli.timeout < 0) {
					printf("Error: timeout cannot be negative\n");
					return 1;
				}
				break;
			case 1007: // --show-reasoning
				cli.show_reasoning = true;
				break;
			case 1008: // --no-thinking
				cli.no_thinking = true;
				break;
			case 'v':
				printf("nimbridge version %s\n", NIMBRIDGE_VERSION);
				return 0;
			case 'h':
				print_usage(argc, argv);
				return 0;
			default:
				print_usage(argc, argv);
				return 1;
		}
	}

	Logger& logger = Logger::instance();
	if (g_debug_level) {
		logger.set_log_level(LogLevel::DEBUG);
	}
	if (!log_file.empty()) {
		logger.set_log_file(log_file);
	}

	Config config;
	try {
		if (!config_file_path.empty()) {
			config.set_config_path(config_file_path);
		}
		config.load();
		config.apply_environment();

		if (!cli.api_base.empty()) config.api_base = cli.api_base;
		if (!cli.api_key.empty()) config.api_key = cli.api_key;
		if (!cli.host.empty()) config.host = cli.host;
		if (cli.port > 0) config.port = cli.port;
		if (cli.token_budget > 0) config.token_budget = cli.token_budget;
		if (cli.timeout >= 0) config.upstream_timeout = cli.timeout;
		if (cli.show_reasoning) config.show_reasoning = true;
		if (cli.no_thinking) config.thinking_mode = false;

		config.validate();
	} catch (const ConfigError& e) {
		LOG_FATAL(std::string("Configuration error: ") + e.what());
		return 1;
	}

	if (!g_debug_level) {
		logger.set_log_level(Logger::parse_level(config.log_level));
	}

	// Route SIGINT/SIGTERM to a dedicated thread so shutdown runs outside signal context
	sigset_t signals;
	sigemptyset(&signals);
	sigaddset(&signals, SIGINT);
	sigaddset(&signals, SIGTERM);
	pthread_sigmask(SIG_BLOCK, &signals, nullptr);

	CurlGlobal curl_global;
	HttpUpstream upstream(config);
	APIServer server(config, upstream);

	std::thread signal_thread([&server, signals]() {
		int sig = 0;
		if (sigwait(&signals, &sig) == 0) {
			LOG_INFO("Received signal " + std::to_string(sig) + ", shutting down");
			server.shutdown();
		}
	});
	signal_thread.detach();

	LOG_INFO("nimbridge " + std::string(NIMBRIDGE_VERSION) + " starting");
	LOG_INFO("Upstream: " + upstream.get_api_endpoint());
	LOG_INFO(std::string("Thinking mode: ") + (config.thinking_mode ? "enabled" : "disabled") +
	         ", reasoning display: " + (config.show_reasoning ? "enabled" : "disabled"));
	LOG_INFO_FMT("History budget: {} tokens, lead-in window: {} chars, {} patterns",
	             config.token_budget, config.normalize_threshold, config.lead_in_patterns.size());

	return server.run();
}
