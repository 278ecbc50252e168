#include "catch.hpp"

#include "policy/DestructiveClassifier.hpp"

#include <stdexcept>
#include <string>
#include <vector>

SCENARIO("default vocabulary flags destructive verbs", "[classifier]") {
    policy::DestructiveClassifier classifier;

    REQUIRE(classifier.IsDestructive("Quarantine and delete the encrypted files immediately."));
    REQUIRE(classifier.IsDestructive("KILL the process tree"));
    REQUIRE(classifier.IsDestructive("Uninstall the package, then reboot."));
    REQUIRE(classifier.IsDestructive("erase"));
    REQUIRE(classifier.IsDestructive("pre-remove hook"));
}

SCENARIO("non-destructive text passes", "[classifier]") {
    policy::DestructiveClassifier classifier;

    REQUIRE_FALSE(classifier.IsDestructive("Monitor the host and update signatures."));
    REQUIRE_FALSE(classifier.IsDestructive(""));
    REQUIRE_FALSE(classifier.IsDestructive("Skill assessment of the analyst"));
}

SCENARIO("inflected forms are not in the default vocabulary", "[classifier]") {
    policy::DestructiveClassifier classifier;

    REQUIRE_FALSE(classifier.IsDestructive("Consider deleting the cache"));
    REQUIRE_FALSE(classifier.IsDestructive("Schedule removal of the agent"));
}

SCENARIO("custom vocabulary replaces the defaults", "[classifier]") {
    policy::DestructiveClassifier classifier{{"Wipe", " shred ", ""}};

    REQUIRE(classifier.Terms().size() == 2);
    REQUIRE(classifier.IsDestructive("wipe the disk"));
    REQUIRE(classifier.IsDestructive("Shred the logs"));
    REQUIRE_FALSE(classifier.IsDestructive("delete the file"));
}

SCENARIO("a vocabulary with no usable word is refused", "[classifier]") {
    GIVEN("an empty term list") {
        std::vector<std::string> terms;

        THEN("construction fails instead of approving everything") {
            REQUIRE_THROWS_AS(policy::DestructiveClassifier{terms}, std::invalid_argument);
        }
    }

    GIVEN("the list an empty destructive_terms setting splits into") {
        std::vector<std::string> terms{""};

        THEN("construction fails") {
            REQUIRE_THROWS_AS(policy::DestructiveClassifier{terms}, std::invalid_argument);
        }
    }

    GIVEN("only blank entries") {
        std::vector<std::string> terms{" ", "\t"};

        THEN("construction fails") {
            REQUIRE_THROWS_AS(policy::DestructiveClassifier{terms}, std::invalid_argument);
        }
    }
}

SCENARIO("a term that can never equal a token is refused", "[classifier]") {
    GIVEN("a term with punctuation") {
        std::vector<std::string> terms{"delete", "rm-rf"};

        THEN("construction fails rather than silently dropping the punctuation") {
            REQUIRE_THROWS_AS(policy::DestructiveClassifier{terms}, std::invalid_argument);
        }
    }

    GIVEN("a term with an inner space") {
        std::vector<std::string> terms{"rm rf"};

        THEN("construction fails") {
            REQUIRE_THROWS_AS(policy::DestructiveClassifier{terms}, std::invalid_argument);
        }
    }

    GIVEN("a term longer than any token that is compared") {
        std::vector<std::string> terms{std::string(65, 'x')};

        THEN("construction fails") {
            REQUIRE_THROWS_AS(policy::DestructiveClassifier{terms}, std::invalid_argument);
        }
    }
}

SCENARIO("tokens longer than any term never match", "[classifier]") {
    policy::DestructiveClassifier classifier;

    REQUIRE_FALSE(classifier.IsDestructive(std::string(200, 'a') + "delete"));
    REQUIRE(classifier.IsDestructive(std::string(200, 'a') + " delete"));
}
