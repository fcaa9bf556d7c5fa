#include "clouddrive/client/session.hpp"

#include <iostream>

namespace clouddrive::client
{

    namespace
    {

        void print_login_instructions(const PendingAuthState &state)
        {
            std::cout << "To sign in, open " << state.verification_uri << " and enter the code " << state.user_code
                      << std::endl;
            std::cout << "Then run any command (for example 'clouddrive auth status') to finish the login."
                      << std::endl;
        }

    } // namespace

    int ClientSession::handle_auth(const std::vector<std::string> &args)
    {
        if (!expect_args(args, 1, 1, "auth login|logout|status"))
        {
            return kExitFailure;
        }
        const auto &action = args[0];
        if (action == "login")
        {
            return auth_login();
        }
        if (action == "logout")
        {
            return auth_logout();
        }
        if (action == "status")
        {
            return auth_status();
        }
        std::cout << "ERROR: invalid_usage" << std::endl;
        std::cout << "Usage: auth login|logout|status" << std::endl;
        return kExitFailure;
    }

    int ClientSession::auth_login()
    {
        if (!settings_.token.empty())
        {
            std::cout << "Already logged in. Run 'clouddrive auth logout' first." << std::endl;
            return kExitFailure;
        }
        if (const auto pending = state_store_.load_auth())
        {
            std::cout << "A login is already pending." << std::endl;
            print_login_instructions(*pending);
            return kExitFailure;
        }

        const auto response = oauth_.start_device_code();
        const PendingAuthState state{
            .device_code = response.device_code,
            .user_code = response.user_code,
            .verification_uri = response.verification_uri,
            .interval = response.interval,
        };
        state_store_.save_auth(state);
        logger_.log("auth", "device-code login started");
        if (!response.message.empty())
        {
            std::cout << response.message << std::endl;
        }
        print_login_instructions(state);
        return kExitSuccess;
    }

    int ClientSession::auth_logout()
    {
        settings_.token = remote::Credential{};
        save_settings(config_path_, settings_);
        state_store_.remove_auth();
        logger_.log("auth", "logged out");
        std::cout << "Logged out." << std::endl;
        return kExitSuccess;
    }

    int ClientSession::auth_status()
    {
        if (state_store_.load_auth())
        {
            if (!complete_pending_login())
            {
                return kExitFailure;
            }
        }
        if (settings_.token.empty())
        {
            std::cout << "Not logged in." << std::endl;
            return kExitSuccess;
        }
        const auto user = remote().get_me();
        std::cout << "Logged in as " << user.display_name << " (" << user.user_principal_name << ")" << std::endl;
        return kExitSuccess;
    }

    bool ClientSession::complete_pending_login()
    {
        const auto pending = state_store_.load_auth();
        if (!pending)
        {
            return true;
        }

        try
        {
            auto credential = oauth_.verify_device_code(pending->device_code);
            persist_credential(credential);
            state_store_.remove_auth();
            graph_.reset();
            credentials_.reset();
            credential_source_.reset();
            logger_.log("auth", "device-code login completed");
            std::cout << "Login successful." << std::endl;
            return true;
        }
        catch (const Error &ex)
        {
            if (ex.code() == ErrorCode::AuthorizationPending)
            {
                std::cout << "Login is still pending." << std::endl;
                print_login_instructions(*pending);
                return false;
            }
            state_store_.remove_auth();
            print_error(ex.code(), std::string("login failed: ") + ex.what());
            logger_.warn("auth", "device-code login failed: ", ex.what());
            return false;
        }
    }

    void ClientSession::persist_credential(const remote::Credential &credential)
    {
        settings_.token = credential;
        save_settings(config_path_, settings_);
    }

} // namespace clouddrive::client
