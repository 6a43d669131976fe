#include "builtin_templates.hpp"

static BuiltinTemplate make_default_template() {
    BuiltinTemplate t;
    t.name = "default";
    t.yaml =
        "name: default\n"
        "version: \"1.0\"\n"
        "author: penlab\n"
        "description: Generic pentest layout (recon, exploitation, loot, report)\n"
        "tags: [generic, htb, ctf]\n"
        "\n"
        "variables:\n"
        "  target: \"\"\n"
        "  your-ip: \"\"\n"
        "\n"
        "structure:\n"
        "  - dir: recon\n"
        "    files:\n"
        "      - name: notes.md\n"
        "        content: |\n"
        "          # Recon - {project-name}\n"
        "\n"
        "          Target: {target}\n"
        "          Date: {date}\n"
        "    subdirs:\n"
        "      - dir: nmap\n"
        "      - dir: web\n"
        "  - dir: exploitation\n"
        "    files:\n"
        "      - name: shell.sh\n"
        "        executable: true\n"
        "        content: |\n"
        "          #!/bin/sh\n"
        "          # Reverse shell listener for {target}\n"
        "          nc -lvnp 4444 -s {your-ip}\n"
        "  - dir: loot\n"
        "  - dir: screenshots\n"
        "  - dir: report\n"
        "    files:\n"
        "      - name: report.md\n"
        "        content: |\n"
        "          # {project-name} report\n"
        "\n"
        "          Author: {author}\n"
        "          Target: {target}\n"
        "\n"
        "global_files:\n"
        "  - name: README.md\n"
        "    content: |\n"
        "      # {project-name}\n"
        "\n"
        "      - Target: {target}\n"
        "      - Attacker: {your-ip}\n"
        "      - Author: {author}\n"
        "      - Created: {date}\n";
    return t;
}

static BuiltinTemplate make_web_template() {
    BuiltinTemplate t;
    t.name = "web";
    t.yaml =
        "name: web\n"
        "version: \"1.0\"\n"
        "author: penlab\n"
        "description: Web application assessment\n"
        "tags: [web, owasp]\n"
        "\n"
        "variables:\n"
        "  target: \"\"\n"
        "  domain: \"\"\n"
        "\n"
        "structure:\n"
        "  - dir: recon\n"
        "    subdirs:\n"
        "      - dir: subdomains\n"
        "      - dir: fuzzing\n"
        "        files:\n"
        "          - name: wordlists.txt\n"
        "            content: \"/usr/share/seclists/Discovery/Web-Content/common.txt\\n\"\n"
        "  - dir: requests\n"
        "  - dir: findings\n"
        "    files:\n"
        "      - name: \"{domain}-findings.md\"\n"
        "        content: |\n"
        "          # Findings for {domain} ({target})\n"
        "\n"
        "global_files:\n"
        "  - name: scope.md\n"
        "    content: |\n"
        "      # Scope\n"
        "\n"
        "      - Host: {target}\n"
        "      - Domain: {domain}\n";
    return t;
}

const std::vector<BuiltinTemplate>& builtin_templates() {
    static const std::vector<BuiltinTemplate> templates = {
        make_default_template(),
        make_web_template(),
    };
    return templates;
}

const BuiltinTemplate* get_builtin_template(const std::string& name) {
    for (const auto& t : builtin_templates()) {
        if (t.name == name) return &t;
    }
    return nullptr;
}
